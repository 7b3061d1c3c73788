#pragma once
#include "pipeline/filter.h"

class DebugFilter : public IConnectionFilter {
public:
    explicit DebugFilter(bool enabled = false) : m_enabled(enabled) {}
    QString name() const override { return "debug"; }
    Result<NextAction> onRead(FilterContext& ctx) override;
    Result<NextAction> onWrite(FilterContext& ctx) override;
    Result<NextAction> onClose(FilterContext& ctx) override;

private:
    bool m_enabled;
};
