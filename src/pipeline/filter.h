#pragma once
#include "filter_context.h"
#include "protocol/result.h"

class IConnectionFilter {
public:
    virtual ~IConnectionFilter() = default;
    virtual QString name() const = 0;

    virtual Result<NextAction> onRead(FilterContext& ctx) {
        return ctx.invoke();
    }
    virtual Result<NextAction> onWrite(FilterContext& ctx) {
        return ctx.invoke();
    }
    virtual Result<NextAction> onClose(FilterContext& ctx) {
        return ctx.invoke();
    }
};
