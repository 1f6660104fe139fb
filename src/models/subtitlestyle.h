#ifndef SUBTITLESTYLE_H
#define SUBTITLESTYLE_H

#include <QJsonObject>
#include <QString>


// Поля стиля Default, которые разрешено переписывать перед прожигом
struct SubtitleStyle {
    QString fontName;                       // Пусто - имя выбирает FontResolver
    int fontSize = 24;
    QString primaryColor = "&H00FFFFFF";    // ASS: &HAABBGGRR
    QString outlineColor = "&H00000000";
    bool bold = false;
    int alignment = 2;                      // Нумпад-раскладка, 2 - снизу по центру
    int marginL = 10;
    int marginR = 10;
    int marginV = 20;

    void read(const QJsonObject &json);
    void write(QJsonObject &json) const;
};

#endif // SUBTITLESTYLE_H
