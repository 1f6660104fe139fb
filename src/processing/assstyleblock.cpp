#include "assstyleblock.h"

QStringList AssStyleBlock::requiredColumns()
{
    return {"Name", "Fontname", "Fontsize", "PrimaryColour", "Bold", "Alignment"};
}

bool AssStyleBlock::parse(const QString& scriptText, QString& error)
{
    m_lines = scriptText.split('\n');
    m_sectionName.clear();
    m_columnNames.clear();
    m_columns.clear();
    m_styleLineIndexes.clear();

    int sectionStart = -1;
    for (int i = 0; i < m_lines.size(); ++i)
    {
        const QString trimmed = m_lines[i].trimmed();
        if (trimmed.compare("[V4+ Styles]", Qt::CaseInsensitive) == 0 ||
            trimmed.compare("[V4 Styles]", Qt::CaseInsensitive) == 0)
        {
            sectionStart = i;
            m_sectionName = trimmed;
            break;
        }
    }

    if (sectionStart < 0)
    {
        error = "В файле субтитров нет секции [V4+ Styles].";
        return false;
    }

    for (int i = sectionStart + 1; i < m_lines.size(); ++i)
    {
        const QString trimmed = m_lines[i].trimmed();
        if (trimmed.startsWith('['))
        {
            break;
        }

        if (trimmed.startsWith("Format:", Qt::CaseInsensitive) && m_columnNames.isEmpty())
        {
            const QStringList names = trimmed.mid(QString("Format:").length()).split(',');
            for (const QString& name : names)
            {
                m_columns.insert(name.trimmed().toLower(), m_columnNames.size());
                m_columnNames.append(name.trimmed());
            }
        }
        else if (trimmed.startsWith("Style:", Qt::CaseInsensitive))
        {
            m_styleLineIndexes.append(i);
        }
    }

    if (m_columnNames.isEmpty())
    {
        error = QString("В секции %1 нет строки Format:.").arg(m_sectionName);
        return false;
    }

    QStringList missing;
    for (const QString& column : requiredColumns())
    {
        if (columnIndex(column) < 0)
        {
            missing.append(column);
        }
    }
    if (!missing.isEmpty())
    {
        error = QString("В строке Format секции %1 не объявлены обязательные поля: %2.")
                    .arg(m_sectionName, missing.join(", "));
        return false;
    }

    return true;
}

int AssStyleBlock::columnIndex(const QString& columnName) const
{
    return m_columns.value(columnName.toLower(), -1);
}

QStringList AssStyleBlock::styleNames() const
{
    QStringList names;
    const int nameIndex = columnIndex("Name");
    for (int lineIndex : m_styleLineIndexes)
    {
        StyleRow row;
        QString body = m_lines[lineIndex];
        if (body.endsWith('\r'))
        {
            body.chop(1);
        }
        if (nameIndex >= 0 && splitRow(body, row))
        {
            names.append(row.fields[nameIndex].trimmed());
        }
    }
    return names;
}

int AssStyleBlock::applyDefaultStyle(const SubtitleStyle& style, QStringList& warnings)
{
    const int nameIndex = columnIndex("Name");
    if (nameIndex < 0)
    {
        return 0;
    }

    int rewritten = 0;
    for (int lineIndex : m_styleLineIndexes)
    {
        StyleRow row;
        row.lineIndex = lineIndex;
        QString body = m_lines[lineIndex];
        if (body.endsWith('\r'))
        {
            body.chop(1);
            row.lineEnding = "\r";
        }

        if (!splitRow(body, row))
        {
            warnings.append(QString("Строка стиля %1 содержит меньше полей, чем объявлено в Format (%2), пропущена.")
                                .arg(lineIndex + 1)
                                .arg(columnCount()));
            continue;
        }

        if (row.fields[nameIndex].trimmed().compare("Default", Qt::CaseInsensitive) != 0)
        {
            continue;
        }

        if (!style.fontName.isEmpty())
        {
            setField(row, "Fontname", style.fontName);
        }
        setField(row, "Fontsize", QString::number(style.fontSize));
        setField(row, "PrimaryColour", style.primaryColor);
        setField(row, "OutlineColour", style.outlineColor);
        setField(row, "Bold", style.bold ? "-1" : "0");
        setField(row, "Alignment", QString::number(style.alignment));
        setField(row, "MarginL", QString::number(style.marginL));
        setField(row, "MarginR", QString::number(style.marginR));
        setField(row, "MarginV", QString::number(style.marginV));

        m_lines[lineIndex] = row.prefix + row.fields.join(',') + row.lineEnding;
        ++rewritten;
    }
    return rewritten;
}

QString AssStyleBlock::toText() const
{
    return m_lines.join('\n');
}

bool AssStyleBlock::splitRow(const QString& body, StyleRow& row) const
{
    const int colonPos = body.indexOf(':');
    if (colonPos < 0)
    {
        return false;
    }

    int valueStart = colonPos + 1;
    while (valueStart < body.size() && body.at(valueStart).isSpace())
    {
        ++valueStart;
    }
    row.prefix = body.left(valueStart);

    QStringList fields = body.mid(valueStart).split(',');
    const int expected = columnCount();
    if (fields.size() < expected)
    {
        return false;
    }
    if (fields.size() > expected)
    {
        // Лишние запятые относятся к последнему полю
        const QString tail = fields.mid(expected - 1).join(',');
        fields = fields.mid(0, expected - 1);
        fields.append(tail);
    }
    row.fields = fields;
    return true;
}

void AssStyleBlock::setField(StyleRow& row, const QString& columnName, const QString& value) const
{
    const int index = columnIndex(columnName);
    if (index < 0 || index >= row.fields.size())
    {
        return;
    }
    row.fields[index] = value;
}
