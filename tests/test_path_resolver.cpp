#include <QtTest>
#include <QDir>
#include "../src/path_resolver.h"

class TestPathResolver : public QObject {
    Q_OBJECT
private slots:
    void testExactTaskMatch();
    void testAssetMatchWhenTaskMisses();
    void testAmbiguousContainment();
    void testSingleContainedKeywordIsNotAmbiguous();
    void testDefaultFootageRule();
    void testUnmappedFootage();
    void testDynamicSegmentCasing();
    void testNormalizeSubpath();
    void testIdempotent();
};

static const QString kRoot = QDir::cleanPath(QDir::tempPath() + "/project");

static FolderRule rule(const QString& subpath, const QStringList& keywords)
{
    FolderRule r;
    r.destinationSubpath = subpath;
    r.keywords = keywords;
    return r;
}

void TestPathResolver::testExactTaskMatch()
{
    const QVector<FolderRule> rules = { rule("3D/Renders", {"beauty", "lighting"}), rule("2D/Comp", {"comp"}) };
    TagSet tags;
    tags.shot = "SC001";
    tags.task = "Beauty";
    tags.version = "v001";

    const Resolution r = PathResolver::resolve(kRoot, rules, "SC001_beauty_v001.exr", tags);
    QVERIFY(!r.ambiguous);
    QVERIFY(!r.usedDefaultRule);
    QCOMPARE(r.chosenSubpath, QString("3D/Renders"));
    QCOMPARE(r.destinationDir.value_or(QString()), kRoot + "/3D/Renders/SC001/beauty/v001");
    QCOMPARE(r.destinationPath.value_or(QString()), kRoot + "/3D/Renders/SC001/beauty/v001/SC001_beauty_v001.exr");
}

void TestPathResolver::testAssetMatchWhenTaskMisses()
{
    const QVector<FolderRule> rules = { rule("assets/chars", {"hero"}) };
    TagSet tags;
    tags.task = "anim";
    tags.asset = "HERO";
    const Resolution r = PathResolver::resolve(kRoot, rules, "hero_anim.abc", tags);
    QCOMPARE(r.chosenSubpath, QString("assets/chars"));
    QVERIFY(!r.usedDefaultRule);
}

void TestPathResolver::testAmbiguousContainment()
{
    const QVector<FolderRule> rules = { rule("A", {"beauty"}), rule("B", {"fx"}) };
    TagSet tags;
    tags.task = "beauty_fx";

    const Resolution r = PathResolver::resolve(kRoot, rules, "SC001_beauty_fx_v001.exr", tags);
    QVERIFY(r.ambiguous);
    QVERIFY(!r.destinationDir.has_value());
    QVERIFY(!r.destinationPath.has_value());
    const QVector<AmbiguousOption> expected = { {"beauty", "A"}, {"fx", "B"} };
    QCOMPARE(r.ambiguousOptions, expected);
}

void TestPathResolver::testSingleContainedKeywordIsNotAmbiguous()
{
    // Two contained keywords that map to the same folder are not ambiguous
    const QVector<FolderRule> rules = { rule("FX", {"fx", "smoke"}), rule("footage", {"plate"}) };
    TagSet tags;
    tags.task = "smoke_fx";
    const Resolution r = PathResolver::resolve(kRoot, rules, "smoke_fx.exr", tags);
    QVERIFY(!r.ambiguous);
    QVERIFY(r.usedDefaultRule);
    QCOMPARE(r.chosenSubpath, QString("footage"));
}

void TestPathResolver::testDefaultFootageRule()
{
    const QVector<FolderRule> rules = {
        rule("misc", {"plate"}),
        rule("Footage/Incoming", {"Footage", "video", "source", "plate", "plates"}),
    };
    QCOMPARE(PathResolver::defaultFootageSubpath(rules), QString("Footage/Incoming"));

    TagSet tags;
    tags.shot = "SC002";
    const Resolution r = PathResolver::resolve(kRoot, rules, "SC002_unknown.mov", tags);
    QVERIFY(r.usedDefaultRule);
    QCOMPARE(r.destinationDir.value_or(QString()), kRoot + "/Footage/Incoming/SC002");

    // Without a rule holding the full keyword set, any footage keyword qualifies
    const QVector<FolderRule> partial = { rule("2D/Comp", {"comp"}), rule("plates", {"plate"}) };
    QCOMPARE(PathResolver::defaultFootageSubpath(partial), QString("plates"));
}

void TestPathResolver::testUnmappedFootage()
{
    const QVector<FolderRule> rules = { rule("2D/Comp", {"comp"}) };
    const Resolution r = PathResolver::resolve(kRoot, rules, "notes.pdf", TagSet());
    QVERIFY(r.usedDefaultRule);
    QCOMPARE(r.destinationPath.value_or(QString()), kRoot + "/unmapped_footage/notes.pdf");
}

void TestPathResolver::testDynamicSegmentCasing()
{
    TagSet tags;
    tags.shot = "Sc010";
    tags.stage = "WIP";
    tags.task = "Comp";
    tags.asset = "Hero";
    tags.resolution = "4k";
    tags.version = "V003";
    QCOMPARE(PathResolver::dynamicSegments(tags),
             QStringList({"Sc010", "wip", "comp", "hero", "4K", "v003"}));

    TagSet blank;
    blank.task = QString("  ");
    QVERIFY(PathResolver::dynamicSegments(blank).isEmpty());
}

void TestPathResolver::testNormalizeSubpath()
{
    QCOMPARE(PathResolver::normalizeSubpath("\\2D\\Comp"), QString("2D/Comp"));
    QCOMPARE(PathResolver::normalizeSubpath("/3D/Renders"), QString("3D/Renders"));

    const QVector<FolderRule> rules = { rule("\\2D\\Comp", {"comp"}) };
    TagSet tags;
    tags.task = "comp";
    const Resolution r = PathResolver::resolve(kRoot, rules, "a.exr", tags);
    QCOMPARE(r.destinationDir.value_or(QString()), kRoot + "/2D/Comp/comp");
}

void TestPathResolver::testIdempotent()
{
    const QVector<FolderRule> rules = { rule("A", {"beauty"}), rule("B", {"fx"}), rule("C", {"plate"}) };
    TagSet tags;
    tags.shot = "SC001";
    tags.task = "beauty";
    const Resolution a = PathResolver::resolve(kRoot, rules, "x.exr", tags);
    const Resolution b = PathResolver::resolve(kRoot, rules, "x.exr", tags);
    QCOMPARE(a.destinationPath, b.destinationPath);
    QCOMPARE(a.ambiguousOptions, b.ambiguousOptions);
    QCOMPARE(a.usedDefaultRule, b.usedDefaultRule);
}

QTEST_APPLESS_MAIN(TestPathResolver)
#include "test_path_resolver.moc"
