#include <QApplication>

#include <locale.h>

#include "mongogui/core/AppRegistry.h"
#include "mongogui/core/mongodb/MongoInitializer.h"
#include "mongogui/core/settings/SettingsManager.h"
#include "mongogui/core/utils/Logger.h"
#include "mongogui/gui/MainWindow.h"

int main(int argc, char *argv[], char** envp)
{
#ifdef Q_OS_WIN
    envp = NULL;
#endif

    QApplication::setAttribute(Qt::AA_EnableHighDpiScaling);

    MongoGui::initializeMongoClient(argc, argv, envp);

    QApplication app(argc, argv);

    // Number formatting of POSIX functions (used by the BSON json writer) must not follow system locale
    setlocale(LC_NUMERIC, "C");

#ifdef Q_OS_MAC
    app.setAttribute(Qt::AA_UseHighDpiPixmaps);
#endif

    auto const& settingsManager = MongoGui::AppRegistry::instance().settingsManager();
    MongoGui::LOG_MSG(QString("%1 %2 started, config: %3, log: %4")
        .arg(PROJECT_NAME).arg(PROJECT_VERSION)
        .arg(settingsManager->configFilePath())
        .arg(MongoGui::Logger::instance().logFilePath()),
        mongo::logger::LogSeverity::Info(), false);

    MongoGui::MainWindow mainWindow;
    mainWindow.show();

    return app.exec();
}
