#include <gtest/gtest.h>
#include <QFile>
#include <QBuffer>
#include <QJsonObject>
#include <QJsonDocument>
#include <QTemporaryDir>
#include "qstring_printer.hpp"
#include "InfinitiveList.hpp"
#include "DefinitionsBuilder.hpp"
#include "WiktionaryDumpReader.hpp"

class DefinitionsBuilderTest : public ::testing::Test {
protected:
    InfinitiveList infinitives;

    void SetUp() override {
        infinitives.setInfinitives({"abaltir", "arrambar", "apoltronar", "complànyer", "cantar"});
    }

    static WikiPage page(const QString& title, const QString& text) {
        return WikiPage{title, text};
    }
};

TEST(CanonicalKeyTest, StripsReflexivePronoun) {
    EXPECT_EQ(DefinitionsBuilder::canonicalKey("apoltronar-se"), QString("apoltronar"));
    EXPECT_EQ(DefinitionsBuilder::canonicalKey("empènyer's"), QString("empènyer"));
    EXPECT_EQ(DefinitionsBuilder::canonicalKey(" Abaltir "), QString("abaltir"));
    EXPECT_EQ(DefinitionsBuilder::canonicalKey("Arrambar-SE"), QString("arrambar"));
    EXPECT_EQ(DefinitionsBuilder::canonicalKey("se"), QString("se"));
}

TEST_F(DefinitionsBuilderTest, StoresVerbDefinition) {
    DefinitionsBuilder builder(infinitives);
    EXPECT_TRUE(builder.addPage(page("abaltir", "===Verb===\n{{ca-verb}}\n#Endormiscar.\n==Vegeu també==\n")));

    const auto& definitions = builder.getDefinitions();
    ASSERT_TRUE(definitions.contains("abaltir"));
    EXPECT_TRUE(definitions["abaltir"].contains("<li>Endormiscar.</li>")) << definitions["abaltir"].toStdString();
}

TEST_F(DefinitionsBuilderTest, PageWithoutVerbMarkerIsExcluded) {
    DefinitionsBuilder builder(infinitives);
    EXPECT_FALSE(builder.addPage(page("abaltir", "===Verb===\n{{ca-nom}}\n#Endormiscar.\n==Fi==\n")));
    EXPECT_TRUE(builder.getDefinitions().isEmpty());
}

TEST_F(DefinitionsBuilderTest, PageNotInInfinitivesIsExcluded) {
    DefinitionsBuilder builder(infinitives);
    EXPECT_FALSE(builder.addPage(page("córrer", "===Verb===\n{{ca-verb}}\n#Anar de pressa.\n==Fi==\n")));
    EXPECT_TRUE(builder.getDefinitions().isEmpty());
}

TEST_F(DefinitionsBuilderTest, PageWithoutDescriptionIsExcluded) {
    DefinitionsBuilder builder(infinitives);
    EXPECT_FALSE(builder.addPage(page("cantar", "{{ca-verb}}\n===Nom===\n# Cant.\n==Fi==\n")));
    EXPECT_FALSE(builder.addPage(page("cantar", "===Verb===\n{{ca-verb}}\n==Fi==\n")));
    EXPECT_TRUE(builder.getDefinitions().isEmpty());
}

TEST_F(DefinitionsBuilderTest, ReflexivePageUsesCanonicalKey) {
    DefinitionsBuilder builder(infinitives);
    EXPECT_TRUE(builder.addPage(page("Apoltronar-se", "===Verb===\n{{ca-verb-pron}}\n# Seure còmodament.\n==Fi==\n")));
    EXPECT_TRUE(builder.getDefinitions().contains("apoltronar"));
}

TEST_F(DefinitionsBuilderTest, LastPageWins) {
    DefinitionsBuilder builder(infinitives);
    builder.addPage(page("arrambar", "===Verb===\n{{ca-verb}}\n# Primer.\n==Fi==\n"));
    builder.addPage(page("arrambar-se", "===Verb===\n{{ca-verb}}\n# Segon.\n==Fi==\n"));
    EXPECT_EQ(builder.getDefinitions().value("arrambar"), QString("<ol><li>Segon.</li>"));
}

TEST_F(DefinitionsBuilderTest, CustomVerbMarker) {
    DefinitionsBuilder builder(infinitives);
    builder.setVerbMarker("{{verb");
    EXPECT_TRUE(builder.addPage(page("cantar", "===Verb===\n{{verb|ca}}\n# Fer sons musicals.\n==Fi==\n")));
}

TEST_F(DefinitionsBuilderTest, Report) {
    DefinitionsBuilder builder(infinitives);
    builder.addPage(page("abaltir", "===Verb===\n{{ca-verb}}\n#Endormiscar.\n==Fi==\n"));
    builder.addPage(page("cantar", "===Verb===\n{{ca-verb}}\n# Fer sons musicals.\n==Fi==\n"));

    const auto report = builder.report();
    EXPECT_EQ(report.defined, 2);
    EXPECT_EQ(report.undefined, 3);
}

TEST_F(DefinitionsBuilderTest, DumpWritesTextAndJson) {
    DefinitionsBuilder builder(infinitives);
    builder.addPage(page("cantar", "===Verb===\n{{ca-verb}}\n# Fer sons musicals.\nnota\n==Fi==\n"));
    builder.addPage(page("abaltir", "===Verb===\n{{ca-verb}}\n#Endormiscar.\n==Fi==\n"));

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString outDir = dir.filePath("out");
    ASSERT_TRUE(builder.dump(outDir)) << "the output directory is created when missing";

    QFile text(outDir + "/definitions.txt");
    ASSERT_TRUE(text.open(QIODevice::ReadOnly));
    EXPECT_EQ(QString::fromUtf8(text.readAll()),
              QString("abaltir\n<ol><li>Endormiscar.</li>\n"
                      "cantar\n<ol><li>Fer sons musicals.</li></ol>nota\n\n"))
        << "entries follow the order of the infinitives file";

    QFile json(outDir + "/definitions.json");
    ASSERT_TRUE(json.open(QIODevice::ReadOnly));
    const auto object = QJsonDocument::fromJson(json.readAll()).object();
    EXPECT_EQ(object.size(), 2);
    EXPECT_EQ(object.value("abaltir").toString(), QString("<ol><li>Endormiscar.</li>"));
    EXPECT_EQ(object.value("cantar").toString(), QString("<ol><li>Fer sons musicals.</li></ol>nota\n"));
}

TEST_F(DefinitionsBuilderTest, DumpFromXml) {
    QByteArray dump =
        "<mediawiki>"
        "<page><title>abaltir</title><revision><text>===Verb===\n{{ca-verb}}\n#Endormiscar.\n==...==</text></revision></page>"
        "<page><title>arrambar</title><revision><text>===Verb===\n# Sense plantilla.\n==Fi==</text></revision></page>"
        "<page><title>Viccionari:Portada</title><revision><text>{{ca-verb}}</text></revision></page>"
        "</mediawiki>";
    QBuffer buffer(&dump);
    ASSERT_TRUE(buffer.open(QIODevice::ReadOnly));

    DefinitionsBuilder builder(infinitives);
    WiktionaryDumpReader reader;
    ASSERT_TRUE(reader.read(buffer, [&builder](const WikiPage& p) { builder.addPage(p); }));

    const auto& definitions = builder.getDefinitions();
    ASSERT_EQ(definitions.size(), 1);
    EXPECT_TRUE(definitions.value("abaltir").contains("<li>Endormiscar.</li>"));
}
