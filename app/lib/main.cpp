#include <QApplication>
#include <QPalette>
#include <QSettings>
#include <QStyleFactory>

#include "AppLogger.hpp"
#include "RelocatorConfig.hpp"
#include "RelocatorDialog.hpp"

int main(int argc, char* argv[]) {
    QApplication qt_app(argc, argv);

    qt_app.setApplicationName("Media Relocator");
    qt_app.setApplicationVersion("1.0.0");
    qt_app.setOrganizationName("MediaRelocator");

    QSettings settings(QSettings::IniFormat, QSettings::UserScope, "MediaRelocator", "MediaRelocator");
    const RelocatorConfig config = RelocatorConfig::load(settings);

    // Initialize logging
    AppLogger::instance().set_minimum_severity(config.log_level);
    LOG_INFO("Main", QString("Media Relocator started, settings: %1").arg(settings.fileName()));

    // Use Fusion style for consistent look
    qt_app.setStyle(QStyleFactory::create("Fusion"));

    QPalette app_colors;
    app_colors.setColor(QPalette::Window, QColor(45, 45, 45));
    app_colors.setColor(QPalette::WindowText, QColor(230, 230, 230));
    app_colors.setColor(QPalette::Base, QColor(35, 35, 35));
    app_colors.setColor(QPalette::AlternateBase, QColor(55, 55, 55));
    app_colors.setColor(QPalette::Text, QColor(230, 230, 230));
    app_colors.setColor(QPalette::Button, QColor(50, 50, 50));
    app_colors.setColor(QPalette::ButtonText, QColor(230, 230, 230));
    app_colors.setColor(QPalette::Highlight, QColor(0, 120, 212));
    app_colors.setColor(QPalette::HighlightedText, QColor(255, 255, 255));
    qt_app.setPalette(app_colors);

    RelocatorDialog relocator_window(config);
    relocator_window.show();

    int exit_code = qt_app.exec();

    LOG_INFO("Main", "Application exiting");
    return exit_code;
}
