#include <QTest>
#include "proxy/cache_control.h"

namespace {

ChatRequest conversation()
{
    ChatRequest req;
    req.model = QStringLiteral("claude-sonnet-4-5");
    req.system = SystemPrompt::fromText(QStringLiteral("You are a code reviewer."));
    req.messages.append(Message::userText(QStringLiteral("Review this diff.")));
    req.messages.append(Message::assistant({ContentBlock::fromText(QStringLiteral("Looks fine."))}));
    req.messages.append(Message::userText(QStringLiteral("And the tests?")));
    return req;
}

QJsonObject objectSchema()
{
    QJsonObject schema;
    schema[QStringLiteral("type")] = QStringLiteral("object");
    return schema;
}

}

class TestCacheControl : public QObject {
    Q_OBJECT

private slots:
    void testDefaultPlacement() {
        ChatRequest req = conversation();
        QVERIFY(CacheControl::apply(req).has_value());

        QVERIFY(req.system->blocks.last().cacheControl.has_value());
        QCOMPARE(req.system->blocks.last().cacheControl->type, QStringLiteral("ephemeral"));
        QVERIFY(!req.messages[0].content[0].cacheControl.has_value());
        QVERIFY(req.messages[1].content[0].cacheControl.has_value());
        QVERIFY(!req.messages[2].content[0].cacheControl.has_value());
        QCOMPARE(CacheControl::countMarkers(req), 2);
    }

    void testReapplyIsNoOp() {
        ChatRequest req = conversation();
        QVERIFY(CacheControl::apply(req).has_value());
        const ChatRequest once = req;
        QVERIFY(CacheControl::apply(req).has_value());
        QCOMPARE(req, once);
    }

    void testToolsAndUserTurns() {
        ChatRequest req = conversation();
        req.tools = QList<ToolDefinition>{
            ToolDefinition::create(QStringLiteral("read_file"), QString(), objectSchema()),
            ToolDefinition::create(QStringLiteral("write_file"), QString(), objectSchema())
        };
        CachePlacement placement;
        placement.targets = {CacheTarget::tools(), CacheTarget::userTurnFromEnd(1),
                             CacheTarget::userTurnFromEnd(2)};
        placement.ttl = QStringLiteral("1h");

        QVERIFY(CacheControl::apply(req, placement).has_value());
        QVERIFY(!(*req.tools)[0].cacheControl.has_value());
        QCOMPARE((*req.tools)[1].cacheControl->ttl, QStringLiteral("1h"));
        QVERIFY(req.messages[0].content[0].cacheControl.has_value());
        QVERIFY(!req.messages[1].content[0].cacheControl.has_value());
        QVERIFY(req.messages[2].content[0].cacheControl.has_value());
        QVERIFY(!req.system->blocks[0].cacheControl.has_value());
    }

    void testMissingTargetsSkipped() {
        ChatRequest req;
        req.model = QStringLiteral("m");
        req.messages.append(Message::userText(QStringLiteral("only message")));

        CachePlacement placement = CachePlacement::defaults();
        placement.targets.append(CacheTarget::tools());
        placement.targets.append(CacheTarget::userTurnFromEnd(3));

        QVERIFY(CacheControl::apply(req, placement).has_value());
        QCOMPARE(CacheControl::countMarkers(req), 0);
    }

    void testThinkingBlocksNeverMarked() {
        ChatRequest req;
        req.model = QStringLiteral("m");
        req.messages.append(Message::userText(QStringLiteral("q")));
        req.messages.append(Message::assistant({
            ContentBlock::fromText(QStringLiteral("answer")),
            ContentBlock::thinking(QStringLiteral("trailing thought"), QStringLiteral("sig"))
        }));
        req.messages.append(Message::assistant({ContentBlock::redactedThinking(QStringLiteral("x"))}));

        CachePlacement placement;
        placement.targets = {CacheTarget::messageFromEnd(2), CacheTarget::messageFromEnd(1)};
        QVERIFY(CacheControl::apply(req, placement).has_value());

        QVERIFY(req.messages[1].content[0].cacheControl.has_value());
        QVERIFY(!req.messages[1].content[1].cacheControl.has_value());
        QVERIFY(!req.messages[2].content[0].cacheControl.has_value());
        QCOMPARE(CacheControl::countMarkers(req), 1);
    }

    void testLimitExceededLeavesRequestUntouched() {
        ChatRequest req = conversation();
        req.messages[0].content[0].cacheControl = CacheMarker();
        req.messages[2].content[0].cacheControl = CacheMarker();
        const ChatRequest before = req;

        CachePlacement placement = CachePlacement::defaults();
        placement.maxBreakpoints = 3;
        auto result = CacheControl::apply(req, placement);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::BreakpointLimitExceeded);
        QCOMPARE(req, before);

        placement.maxBreakpoints = 4;
        QVERIFY(CacheControl::apply(req, placement).has_value());
        QCOMPARE(CacheControl::countMarkers(req), 4);
    }

    void testInvalidLimit() {
        ChatRequest req = conversation();
        CachePlacement placement = CachePlacement::defaults();
        placement.maxBreakpoints = 5;
        auto result = CacheControl::apply(req, placement);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::InvalidConfig);

        placement.maxBreakpoints = 0;
        QVERIFY(!CacheControl::apply(req, placement).has_value());
    }
};

QTEST_MAIN(TestCacheControl)
#include "tst_cache_control.moc"
