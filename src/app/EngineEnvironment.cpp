#include "app/EngineEnvironment.hpp"

#include <QByteArray>
#include <QCoreApplication>
#include <spdlog/spdlog.h>

#include <utility>

namespace pipeweaver::app {

EngineEnvironment::EngineEnvironment(std::vector<std::string> chromiumFlags,
                                     std::string qpaPlatform)
    : chromiumFlags_(std::move(chromiumFlags)), qpaPlatform_(std::move(qpaPlatform)) {}

EngineEnvironment EngineEnvironment::fromConfig(const infra::AppConfig& config) {
    return EngineEnvironment(config.chromiumFlags, config.qpaPlatform);
}

std::string EngineEnvironment::chromiumFlagsValue() const {
    std::string value;
    for (const auto& flag : chromiumFlags_) {
        if (flag.empty()) {
            continue;
        }
        if (!value.empty()) {
            value += ' ';
        }
        value += flag;
    }
    return value;
}

void EngineEnvironment::apply() const {
    auto flags = chromiumFlagsValue();
    if (!flags.empty()) {
        qputenv("QTWEBENGINE_CHROMIUM_FLAGS", QByteArray::fromStdString(flags));
        spdlog::debug("QTWEBENGINE_CHROMIUM_FLAGS={}", flags);
    }

    if (!qpaPlatform_.empty()) {
        qputenv("QT_QPA_PLATFORM", QByteArray::fromStdString(qpaPlatform_));
        spdlog::debug("QT_QPA_PLATFORM={}", qpaPlatform_);
    }

    QCoreApplication::setAttribute(Qt::AA_ShareOpenGLContexts);
}

} // namespace pipeweaver::app
