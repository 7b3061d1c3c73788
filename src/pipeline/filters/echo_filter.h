#pragma once
#include "pipeline/filter.h"

// Application stage: sends every delivered packet back to its sender.
class EchoFilter : public IConnectionFilter {
public:
    QString name() const override { return "echo"; }
    Result<NextAction> onRead(FilterContext& ctx) override;
};
