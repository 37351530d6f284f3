#include "app/ErrorDialog.hpp"

#include <QProcess>
#include <QString>
#include <QStringList>
#include <spdlog/spdlog.h>

namespace pipeweaver::app {

bool ErrorDialog::show(const std::string& message) {
    const auto text = QString::fromStdString(message);

    int rc = QProcess::execute("kdialog", {"--title", TITLE, "--error", text});
    if (rc >= 0) {
        return true;
    }

    spdlog::warn("Error Running kdialog ({}), falling back to zenity..", rc);
    rc = QProcess::execute("zenity", {"--title", TITLE, "--error", "--text", text});
    if (rc >= 0) {
        return true;
    }

    spdlog::error("Unable to display error dialog: {}", message);
    return false;
}

} // namespace pipeweaver::app
