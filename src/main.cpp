#include <QApplication>
#include <QStyleFactory>
#include "configmanager.h"
#include "mainwindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("SlideSift");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("SlideSift");

    qSetMessagePattern("[%{type}] %{message}");

    // Set a modern style
    app.setStyle(QStyleFactory::create("Fusion"));

    ConfigManager configManager;
    AppConfig config = configManager.loadConfig();

    MainWindow window(config, &configManager);
    window.show();

    return app.exec();
}
