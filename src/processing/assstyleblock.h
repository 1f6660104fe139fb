#ifndef ASSSTYLEBLOCK_H
#define ASSSTYLEBLOCK_H

#include "subtitlestyle.h"

#include <QMap>
#include <QStringList>

/**
 * @brief Typed view over the style section of an ASS/SSA script
 *
 * parse() locates "[V4+ Styles]" (or the SSA "[V4 Styles]") and builds a
 * column map from its "Format:" line. Style rows are addressed through that
 * map, so scripts with reordered or missing optional columns are handled
 * correctly. Lines outside the rows that get rewritten are kept byte-identical,
 * including their line endings.
 */
class AssStyleBlock
{
public:
    AssStyleBlock() = default;

    /**
     * @brief Parses the whole script text.
     * @return false if the style section or its Format line is missing, or a
     *         required column is not declared.
     */
    bool parse(const QString& scriptText, QString& error);

    // -1, если колонка не объявлена в Format
    int columnIndex(const QString& columnName) const;
    int columnCount() const { return m_columnNames.size(); }
    QString sectionName() const { return m_sectionName; }
    QStringList styleNames() const;

    /**
     * @brief Rewrites every style row named "Default" (case-insensitive).
     *
     * Optional columns that are not declared are skipped. Rows whose field
     * count does not match the Format line are left untouched and reported in
     * @p warnings.
     * @return Number of rows rewritten.
     */
    int applyDefaultStyle(const SubtitleStyle& style, QStringList& warnings);

    QString toText() const;

    static QStringList requiredColumns();

private:
    struct StyleRow
    {
        int lineIndex = -1;
        QString prefix;     // "Style: " вместе с исходными пробелами
        QStringList fields;
        QString lineEnding; // "\r" для CRLF-файлов, иначе пусто
    };

    bool splitRow(const QString& body, StyleRow& row) const;
    void setField(StyleRow& row, const QString& columnName, const QString& value) const;

    QStringList m_lines;
    QString m_sectionName;
    QStringList m_columnNames;
    QMap<QString, int> m_columns; // имя в нижнем регистре -> индекс
    QList<int> m_styleLineIndexes;
};

#endif // ASSSTYLEBLOCK_H
