#pragma once
#include <QtGlobal>

using ConnectionId = quint64;

enum class ErrorKind : quint8 {
    Protocol,        // malformed or out-of-protocol message
    Authentication,  // missing, stale or mismatched auth header
    InvalidInput,    // bad configuration / arguments
    Internal
};

enum class NextAction : quint8 {
    Stop,    // consumed, do not forward
    Invoke   // forward to the next filter
};
