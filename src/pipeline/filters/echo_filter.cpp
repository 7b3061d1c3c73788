#include "echo_filter.h"

Result<NextAction> EchoFilter::onRead(FilterContext& ctx) {
    ctx.write(ctx.message());
    return ctx.stop();
}
