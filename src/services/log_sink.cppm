/*!
 * @file        log_sink.cppm
 * @brief       Log sink writing backup events through Qt logging categories.
 * @details     Every event becomes one line on the "keeper.journal" category,
 *              at info, warning or critical level according to its LogType.
 *              Filtering and routing are left to the standard Qt logging
 *              rules (QT_LOGGING_RULES, message handlers).
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/keeper/blob/main/LICENSE.md
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module keeper.services.log_sink;
import keeper.core.eventbus;
#endif

#ifdef Q_MOC_RUN
#define KEEPER_MODULE_EXPORT
#else
#define KEEPER_MODULE_EXPORT export
#endif

/**
 * @brief LogSink backed by QLoggingCategory.
 */
KEEPER_MODULE_EXPORT class CategoryLogSink : public LogSink {
public:
    void write(const LogEvent& event) override;

    /**
     * @brief Formats an event as a single human-readable line.
     * @param event Event to format.
     * @return Line without trailing newline.
     */
    static QString formatLine(const LogEvent& event);
};
