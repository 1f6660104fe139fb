#include "subtitlestyle.h"


void SubtitleStyle::read(const QJsonObject &json)
{
    SubtitleStyle defaults;
    fontName = json["fontName"].toString();
    fontSize = json["fontSize"].toInt(defaults.fontSize);
    primaryColor = json["primaryColor"].toString(defaults.primaryColor);
    outlineColor = json["outlineColor"].toString(defaults.outlineColor);
    bold = json["bold"].toBool(defaults.bold);
    alignment = json["alignment"].toInt(defaults.alignment);
    marginL = json["marginL"].toInt(defaults.marginL);
    marginR = json["marginR"].toInt(defaults.marginR);
    marginV = json["marginV"].toInt(defaults.marginV);
}

void SubtitleStyle::write(QJsonObject &json) const
{
    json["fontName"] = fontName;
    json["fontSize"] = fontSize;
    json["primaryColor"] = primaryColor;
    json["outlineColor"] = outlineColor;
    json["bold"] = bold;
    json["alignment"] = alignment;
    json["marginL"] = marginL;
    json["marginR"] = marginR;
    json["marginV"] = marginV;
}
