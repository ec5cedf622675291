#include "lodestone/error.h"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unauthorized:
            return "Unauthorized";
        case ErrorKind::Forbidden:
            return "Forbidden";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::BadRequest:
            return "BadRequest";
        case ErrorKind::MalformedPath:
            return "MalformedPath";
        case ErrorKind::ProtectedResource:
            return "ProtectedResource";
        case ErrorKind::IOFailure:
            return "IOFailure";
    }
    return "IOFailure";
}

int http_status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unauthorized:
            return 401;
        case ErrorKind::Forbidden:
        case ErrorKind::ProtectedResource:
            return 403;
        case ErrorKind::NotFound:
            return 404;
        case ErrorKind::BadRequest:
        case ErrorKind::MalformedPath:
            return 400;
        case ErrorKind::IOFailure:
            return 500;
    }
    return 500;
}

json error_to_json(const ApiError& error) {
    return json{
            {"kind", error_kind_name(error.kind())},
            {"detail", error.what()}
    };
}
