#include "debug_filter.h"
#include "core/log_manager.h"

Result<NextAction> DebugFilter::onRead(FilterContext& ctx) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Read: connection=%1, command=%2, lines=%3")
            .arg(ctx.connection())
            .arg(ctx.message().command())
            .arg(ctx.message().lineCount()));
    }
    return ctx.invoke();
}

Result<NextAction> DebugFilter::onWrite(FilterContext& ctx) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Write: connection=%1, command=%2, lines=%3")
            .arg(ctx.connection())
            .arg(ctx.message().command())
            .arg(ctx.message().lineCount()));
    }
    return ctx.invoke();
}

Result<NextAction> DebugFilter::onClose(FilterContext& ctx) {
    if (m_enabled) {
        LOG_DEBUG(QStringLiteral("[Debug] Close: connection=%1").arg(ctx.connection()));
    }
    return ctx.invoke();
}
