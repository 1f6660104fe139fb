/**
 * @file assstyleblock_test.cpp
 * @brief Unit tests for ASS style section parsing and Default style rewriting
 */

#include <QtTest/QtTest>

#include "assstyleblock.h"

#include <QFile>

class AssStyleBlockTest : public QObject
{
    Q_OBJECT

private:
    QString testDataPath(const QString& fileName) const;
    QString readFixture(const QString& fileName) const;
    SubtitleStyle sampleStyle() const;

private slots:
    void testParseStandardScript();
    void testOnlyDefaultRowRewritten();
    void testReorderedColumns();
    void testMissingRequiredColumn();
    void testMissingStyleSection();
    void testNoDefaultRow();
    void testCrlfPreserved();
    void testEmptyFontNameKeepsOriginal();
    void testShortRowSkippedWithWarning();
    void testExtraCommasBelongToLastField();
    void testSsaSectionAccepted();
};

QString AssStyleBlockTest::testDataPath(const QString& fileName) const
{
    return QCoreApplication::applicationDirPath() + "/test_data/" + fileName;
}

QString AssStyleBlockTest::readFixture(const QString& fileName) const
{
    QFile file(testDataPath(fileName));
    if (!file.open(QIODevice::ReadOnly))
    {
        return QString();
    }
    return QString::fromUtf8(file.readAll());
}

SubtitleStyle AssStyleBlockTest::sampleStyle() const
{
    SubtitleStyle style;
    style.fontName = "Noto Sans";
    style.fontSize = 24;
    style.primaryColor = "&H00FFFFFF";
    style.outlineColor = "&H00000000";
    style.bold = true;
    style.alignment = 2;
    style.marginL = 10;
    style.marginR = 10;
    style.marginV = 20;
    return style;
}

void AssStyleBlockTest::testParseStandardScript()
{
    const QString text = readFixture("default_style.ass");
    QVERIFY2(!text.isEmpty(), "Fixture default_style.ass is missing");

    AssStyleBlock block;
    QString error;
    QVERIFY2(block.parse(text, error), qPrintable(error));
    QCOMPARE(block.sectionName(), QString("[V4+ Styles]"));
    QCOMPARE(block.columnCount(), 23);
    QCOMPARE(block.columnIndex("Name"), 0);
    QCOMPARE(block.columnIndex("alignment"), 18);
    QCOMPARE(block.columnIndex("Blur"), -1);
    QCOMPARE(block.styleNames(), QStringList({"Default", "Signs"}));
}

void AssStyleBlockTest::testOnlyDefaultRowRewritten()
{
    const QString text = readFixture("default_style.ass");
    AssStyleBlock block;
    QString error;
    QVERIFY2(block.parse(text, error), qPrintable(error));

    QStringList warnings;
    QCOMPARE(block.applyDefaultStyle(sampleStyle(), warnings), 1);
    QVERIFY(warnings.isEmpty());

    const QStringList before = text.split('\n');
    const QStringList after = block.toText().split('\n');
    QCOMPARE(after.size(), before.size());

    int changedLines = 0;
    for (int i = 0; i < before.size(); ++i)
    {
        if (before[i] != after[i])
        {
            ++changedLines;
            QVERIFY(after[i].startsWith("Style: Default,"));
        }
    }
    QCOMPARE(changedLines, 1);

    const QString expected = "Style: Default,Noto Sans,24,&H00FFFFFF,&H000000FF,&H00000000,&H00000000,-1,0,0,0,"
                             "100,100,0,0,1,2,2,2,10,10,20,1";
    QVERIFY(after.contains(expected));
    QVERIFY(block.toText().contains("Dialogue: 0,0:00:01.00,0:00:03.00,Default,,0,0,0,,Hello, world"));
}

void AssStyleBlockTest::testReorderedColumns()
{
    AssStyleBlock block;
    QString error;
    QVERIFY2(block.parse(readFixture("reordered_columns.ass"), error), qPrintable(error));

    SubtitleStyle style = sampleStyle();
    style.bold = false;
    style.alignment = 5;

    QStringList warnings;
    QCOMPARE(block.applyDefaultStyle(style, warnings), 1);

    const QString text = block.toText();
    // Name, Alignment, Bold, PrimaryColour, Fontsize, Fontname
    QVERIFY2(text.contains("Style: default,5,0,&H00FFFFFF,24,Noto Sans"), qPrintable(text));
    QVERIFY(text.contains("Style: Notes,7,0,&H00FFFFFF,20,Verdana"));
    // Необъявленные OutlineColour и Margin* пропускаются
    QVERIFY(!text.contains("&H00000000"));
}

void AssStyleBlockTest::testMissingRequiredColumn()
{
    AssStyleBlock block;
    QString error;
    QVERIFY(!block.parse(readFixture("missing_required_column.ass"), error));
    QVERIFY2(error.contains("Alignment"), qPrintable(error));
}

void AssStyleBlockTest::testMissingStyleSection()
{
    AssStyleBlock block;
    QString error;
    QVERIFY(!block.parse(readFixture("no_styles.ass"), error));
    QVERIFY(!error.isEmpty());
}

void AssStyleBlockTest::testNoDefaultRow()
{
    const QString text = readFixture("no_default.ass");
    AssStyleBlock block;
    QString error;
    QVERIFY2(block.parse(text, error), qPrintable(error));

    QStringList warnings;
    QCOMPARE(block.applyDefaultStyle(sampleStyle(), warnings), 0);
    QCOMPARE(block.toText(), text);
}

void AssStyleBlockTest::testCrlfPreserved()
{
    QString text = readFixture("default_style.ass");
    text.replace("\n", "\r\n");

    AssStyleBlock block;
    QString error;
    QVERIFY2(block.parse(text, error), qPrintable(error));

    QStringList warnings;
    QCOMPARE(block.applyDefaultStyle(sampleStyle(), warnings), 1);

    const QString result = block.toText();
    QCOMPARE(result.count("\r\n"), text.count("\r\n"));
    QVERIFY(result.contains("Style: Default,Noto Sans,24,"));
    QVERIFY(result.contains(",10,10,20,1\r\n"));
}

void AssStyleBlockTest::testEmptyFontNameKeepsOriginal()
{
    AssStyleBlock block;
    QString error;
    QVERIFY2(block.parse(readFixture("default_style.ass"), error), qPrintable(error));

    SubtitleStyle style = sampleStyle();
    style.fontName.clear();
    QStringList warnings;
    QCOMPARE(block.applyDefaultStyle(style, warnings), 1);
    QVERIFY(block.toText().contains("Style: Default,Arial,24,"));
}

void AssStyleBlockTest::testShortRowSkippedWithWarning()
{
    const QString text = "[V4+ Styles]\n"
                         "Format: Name, Fontname, Fontsize, PrimaryColour, Bold, Alignment\n"
                         "Style: Default,Arial,48\n"
                         "\n"
                         "[Events]\n";
    AssStyleBlock block;
    QString error;
    QVERIFY2(block.parse(text, error), qPrintable(error));

    QStringList warnings;
    QCOMPARE(block.applyDefaultStyle(sampleStyle(), warnings), 0);
    QCOMPARE(warnings.size(), 1);
    QCOMPARE(block.toText(), text);
}

void AssStyleBlockTest::testExtraCommasBelongToLastField()
{
    const QString text = "[V4+ Styles]\n"
                         "Format: Name, Fontname, Fontsize, PrimaryColour, Bold, Alignment, Encoding\n"
                         "Style: Default,Arial,48,&H00FFFFFF,0,2,1,extra\n";
    AssStyleBlock block;
    QString error;
    QVERIFY2(block.parse(text, error), qPrintable(error));

    QStringList warnings;
    QCOMPARE(block.applyDefaultStyle(sampleStyle(), warnings), 1);
    QVERIFY2(block.toText().contains("Style: Default,Noto Sans,24,&H00FFFFFF,-1,2,1,extra"), qPrintable(block.toText()));
}

void AssStyleBlockTest::testSsaSectionAccepted()
{
    const QString text = "[Script Info]\n"
                         "ScriptType: v4.00\n"
                         "\n"
                         "[V4 Styles]\n"
                         "Format: Name, Fontname, Fontsize, PrimaryColour, Bold, Alignment\n"
                         "Style: DEFAULT,Arial,48,&H00FFFFFF,0,2\n";
    AssStyleBlock block;
    QString error;
    QVERIFY2(block.parse(text, error), qPrintable(error));
    QCOMPARE(block.sectionName(), QString("[V4 Styles]"));

    QStringList warnings;
    QCOMPARE(block.applyDefaultStyle(sampleStyle(), warnings), 1);
    QVERIFY(block.toText().contains("Style: DEFAULT,Noto Sans,24,&H00FFFFFF,-1,2"));
}

QTEST_MAIN(AssStyleBlockTest)
#include "assstyleblock_test.moc"
