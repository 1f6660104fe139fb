#ifndef PATHESCAPER_H
#define PATHESCAPER_H

#include <QString>

/**
 * @brief Escapes a file path for use inside a single-quoted ffmpeg filter option
 *
 * Separators become '/', then the value is escaped for both ffmpeg parsing
 * levels: '\' -> '\\', ':' -> '\:', and "'" -> "\'\''" (close the quote,
 * emit an escaped quote, reopen the quote). The result is meant to be wrapped
 * in single quotes by the caller, e.g. subtitles='<result>'.
 */
QString escapePathForFfmpegFilter(const QString& path);

#endif // PATHESCAPER_H
