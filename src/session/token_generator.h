#pragma once
#include <QString>

// Session tokens: wall-clock milliseconds mixed with a system random draw.
// Hard to guess, not a cryptographic credential.
class TokenGenerator {
public:
    virtual ~TokenGenerator() = default;
    virtual QString next();
};
