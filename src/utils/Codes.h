//
// Created by nova on 7/27/20.
//

#ifndef ACMEREG_CODES_H
#define ACMEREG_CODES_H

/* Exit Codes */
#define OPTIONS_INVALID 200
#define CONFIG_FILE_INVALID 201
#define INPUT_INVALID 202
#define CRYPTO_FAILED 203
#define REGISTRATION_FAILED 204     /* Directory, nonce, signing, CA rejection */
#define PERSISTENCE_FAILED 205

#define VERSION "v0.1.0"

#endif //ACMEREG_CODES_H
