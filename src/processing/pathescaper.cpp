#include "pathescaper.h"

#include <QDir>

QString escapePathForFfmpegFilter(const QString& path)
{
    QString escaped = QDir::fromNativeSeparators(path);
    // Сначала обратный слэш, иначе последующие замены будут экранированы повторно
    escaped.replace('\\', "\\\\");
    escaped.replace(':', "\\:");
    escaped.replace('\'', "\\'\\''");
    return escaped;
}
