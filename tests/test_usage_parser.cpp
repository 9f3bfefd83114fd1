#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>
#include <fstream>

#include "usage/usage_parser.hpp"

using tokentally::ParseError;
using tokentally::ParseOutcome;

class UsageParserTests : public QObject
{
    Q_OBJECT
private slots:
    void testCompletePart();
    void testCacheTokens();
    void testMissingFieldsDefault();
    void testNoTokensIsIrrelevant();
    void testMissingTypeIsIrrelevant();
    void testOtherEventTypeIsIrrelevant();
    void testMalformedJson();
    void testNonObjectJson();
    void testWrongFieldTypes();
    void testFileReadFailure();
    void testParseFile();
};

void UsageParserTests::testCompletePart()
{
    const auto outcome = tokentally::parseUsageJson(R"({
        "id": "prt_1",
        "messageID": "msg_1",
        "sessionID": "ses_1",
        "type": "step-finish",
        "tokens": {"input": 100, "output": 50, "reasoning": 7},
        "cost": 0.0125
    })");

    QVERIFY(outcome.isRelevant());
    QVERIFY(outcome.part.has_value());
    QVERIFY(!outcome.error.has_value());
    const auto &part = *outcome.part;
    QCOMPARE(QString::fromStdString(part.id), QStringLiteral("prt_1"));
    QCOMPARE(QString::fromStdString(part.messageId), QStringLiteral("msg_1"));
    QCOMPARE(QString::fromStdString(part.sessionId), QStringLiteral("ses_1"));
    QCOMPARE(QString::fromStdString(part.eventType), QStringLiteral("step-finish"));
    QVERIFY(part.tokens.has_value());
    QCOMPARE(part.tokens->input, uint64_t(100));
    QCOMPARE(part.tokens->output, uint64_t(50));
    QCOMPARE(part.tokens->reasoning, uint64_t(7));
    QCOMPARE(part.tokens->cache.read, uint64_t(0));
    QCOMPARE(part.cost, 0.0125);
}

void UsageParserTests::testCacheTokens()
{
    const auto outcome = tokentally::parseUsageJson(
        R"({"type":"step-finish","tokens":{"input":1,"output":2,"cache":{"write":30,"read":40}},"cost":0})");
    QVERIFY(outcome.isRelevant());
    QCOMPARE(outcome.part->tokens->cache.write, uint64_t(30));
    QCOMPARE(outcome.part->tokens->cache.read, uint64_t(40));
}

void UsageParserTests::testMissingFieldsDefault()
{
    const auto outcome = tokentally::parseUsageJson(R"({"type":"step-finish","tokens":{}})");
    QVERIFY(outcome.isRelevant());
    const auto &part = *outcome.part;
    QVERIFY(part.id.empty());
    QVERIFY(part.messageId.empty());
    QVERIFY(part.eventType == "step-finish");
    QCOMPARE(part.tokens->input, uint64_t(0));
    QCOMPARE(part.tokens->output, uint64_t(0));
    QCOMPARE(part.cost, 0.0);
}

void UsageParserTests::testNoTokensIsIrrelevant()
{
    const auto absent = tokentally::parseUsageJson(R"({"id":"prt","type":"text","text":"hi"})");
    QVERIFY(absent.kind == ParseOutcome::Kind::Irrelevant);
    QVERIFY(!absent.part.has_value());
    QVERIFY(!absent.error.has_value());

    const auto nullTokens = tokentally::parseUsageJson(R"({"type":"step-finish","tokens":null})");
    QVERIFY(nullTokens.kind == ParseOutcome::Kind::Irrelevant);
}

void UsageParserTests::testMissingTypeIsIrrelevant()
{
    const auto outcome = tokentally::parseUsageJson(R"({"tokens":{"input":1}})");
    QVERIFY(outcome.kind == ParseOutcome::Kind::Irrelevant);
    QVERIFY(!outcome.part.has_value());

    const auto emptyType = tokentally::parseUsageJson(R"({"type":"","tokens":{"input":1}})");
    QVERIFY(emptyType.kind == ParseOutcome::Kind::Irrelevant);
}

void UsageParserTests::testOtherEventTypeIsIrrelevant()
{
    const auto outcome = tokentally::parseUsageJson(
        R"({"type":"step-start","tokens":{"input":5,"output":5}})");
    QVERIFY(outcome.kind == ParseOutcome::Kind::Irrelevant);
}

void UsageParserTests::testMalformedJson()
{
    const auto truncated = tokentally::parseUsageJson(R"({"tokens": {"input": 1)");
    QVERIFY(truncated.isMalformed());
    QVERIFY(truncated.error->kind == ParseError::Kind::Json);
    QVERIFY(!truncated.error->message.empty());

    const auto empty = tokentally::parseUsageJson("");
    QVERIFY(empty.isMalformed());
    QVERIFY(empty.error->kind == ParseError::Kind::Json);
}

void UsageParserTests::testNonObjectJson()
{
    const auto array = tokentally::parseUsageJson(R"([{"tokens":{"input":1}}])");
    QVERIFY(array.isMalformed());
    QVERIFY(array.error->kind == ParseError::Kind::Json);

    const auto scalar = tokentally::parseUsageJson("42");
    QVERIFY(scalar.isMalformed());
}

void UsageParserTests::testWrongFieldTypes()
{
    const char *documents[] = {
        R"({"type":"step-finish","tokens":{"input":"100"}})",
        R"({"type":"step-finish","tokens":{"input":-5}})",
        R"({"type":"step-finish","tokens":{"output":1.5}})",
        R"({"type":"step-finish","tokens":[1,2,3]})",
        R"({"type":"step-finish","tokens":{"cache":7}})",
        R"({"type":"step-finish","tokens":{"input":1},"cost":"0.5"})",
        R"({"type":"step-finish","tokens":{"input":1},"id":12})",
        R"({"tokens":{"input":1},"type":3})",
    };
    for (const char *document : documents) {
        const auto outcome = tokentally::parseUsageJson(document);
        QVERIFY2(outcome.isMalformed(), document);
        QVERIFY(outcome.error->kind == ParseError::Kind::Json);
    }
}

void UsageParserTests::testFileReadFailure()
{
    const auto outcome = tokentally::parseUsageFile("/nonexistent/tokentally/prt.json");
    QVERIFY(outcome.isMalformed());
    QVERIFY(outcome.error->kind == ParseError::Kind::Io);
}

void UsageParserTests::testParseFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const std::filesystem::path path =
        std::filesystem::path(dir.path().toStdString()) / "prt.json";
    {
        std::ofstream out(path);
        out << R"({"type":"step-finish","tokens":{"input":9,"output":1},"cost":0.001})";
    }

    const auto outcome = tokentally::parseUsageFile(path);
    QVERIFY(outcome.isRelevant());
    QCOMPARE(outcome.part->tokens->input, uint64_t(9));
}

QTEST_MAIN(UsageParserTests)
#include "test_usage_parser.moc"
