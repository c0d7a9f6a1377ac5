#include "CsrfTypes.hpp"

const char* NCsrfTypes::tokenErrorToString(eTokenError e) {
    switch (e) {
        case TOKEN_ERROR_MALFORMED: return "malformed";
        case TOKEN_ERROR_BAD_SIGNATURE: return "bad signature";
        case TOKEN_ERROR_MISSING: return "missing";
        case TOKEN_ERROR_MISMATCH: return "mismatch";
    }

    return "unknown";
}

const char* NCsrfTypes::gateActionToString(eGateAction a) {
    switch (a) {
        case GATE_ACTION_EMBED: return "EMBED";
        case GATE_ACTION_ROTATE: return "ROTATE";
        case GATE_ACTION_REJECT: return "REJECT";
        case GATE_ACTION_ABSENT: return "ABSENT";
        case GATE_ACTION_NONE: return "NONE";
    }

    return "ERROR";
}

const char* NCsrfTypes::algorithmToString(eSigningAlgorithm a) {
    switch (a) {
        case SIGNING_ALGORITHM_HMAC_SHA1: return "HmacSHA1";
        case SIGNING_ALGORITHM_HMAC_SHA256: return "HmacSHA256";
    }

    return "unknown";
}

const char* NCsrfTypes::algorithmDigestName(eSigningAlgorithm a) {
    switch (a) {
        case SIGNING_ALGORITHM_HMAC_SHA1: return "SHA1";
        case SIGNING_ALGORITHM_HMAC_SHA256: return "SHA256";
    }

    return "";
}

size_t NCsrfTypes::algorithmKeyLength(eSigningAlgorithm a) {
    switch (a) {
        case SIGNING_ALGORITHM_HMAC_SHA1: return 20;
        case SIGNING_ALGORITHM_HMAC_SHA256: return 32;
    }

    return 0;
}
