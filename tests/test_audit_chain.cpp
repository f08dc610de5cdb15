#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

#include "common/errors.hpp"
#include "common/hash_utils.hpp"
#include "evidence/audit_chain.hpp"
#include "evidence/chain_verifier.hpp"
#include "store/case_store.hpp"

namespace {

inspector::AuditEvent sealedEvent(const std::string &eventId,
                                  const std::string &prev,
                                  std::int64_t occurredAt,
                                  const std::string &detail)
{
    inspector::AuditEvent event;
    event.eventId = eventId;
    event.caseId = "C1";
    event.eventType = "scan";
    event.action = "host_scan";
    event.status = inspector::AuditStatus::Success;
    event.detailJson = detail;
    event.occurredAt = occurredAt;
    event.chainPrevHash = prev;
    event.chainHash = inspector::AuditChain::computeChainHash(event);
    return event;
}

std::vector<inspector::AuditEvent> buildChain(int count)
{
    std::vector<inspector::AuditEvent> events;
    std::string prev;
    for (int i = 0; i < count; ++i) {
        events.push_back(sealedEvent("evt_" + std::to_string(i), prev, 100 + i,
                                     "{\"step\":" + std::to_string(i) + "}"));
        prev = events.back().chainHash;
    }
    return events;
}

} // namespace

class AuditChainTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testFirstEventHasEmptyPrev();
    void testEventsLinkToPreviousChainHash();
    void testDetailStoredAsHashedBytes();
    void testCasesHaveIndependentChains();
    void testConcurrentAppendsFormSingleChain();
    void testConcurrentConnectionsFormSingleChain();

    void testWalkAcceptsIntactChain();
    void testWalkFlagsEditedDetailAtItsIndexOnly();
    void testWalkFlagsRewrittenChainHashAndSuccessor();
    void testWalkFlagsRemovedEvent();
    void testRaiseIfFailedPicksErrorKind();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void AuditChainTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void AuditChainTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void AuditChainTests::testFirstEventHasEmptyPrev()
{
    inspector::CaseStore store(m_tempDir.filePath(QStringLiteral("first/inspector.db")).toStdString());
    inspector::AuditChain audit(store);

    const auto event = audit.append("C1", "", "scan", "host_scan", inspector::AuditStatus::Started,
                                    "operator", "scan.Service");
    QVERIFY(event.chainPrevHash.empty());
    QVERIFY(event.eventId.rfind("evt_", 0) == 0);
    QVERIFY(inspector::isSha256Hex(event.chainHash));
    QCOMPARE(QString::fromStdString(event.detailJson), QStringLiteral("{}"));
    QCOMPARE(QString::fromStdString(event.chainHash),
             QString::fromStdString(inspector::AuditChain::computeChainHash(event)));
    QVERIFY(store.getCaseOverview("C1").has_value());
}

void AuditChainTests::testEventsLinkToPreviousChainHash()
{
    inspector::CaseStore store(m_tempDir.filePath(QStringLiteral("link/inspector.db")).toStdString());
    inspector::AuditChain audit(store);

    const auto first = audit.append("C1", "dev-1", "scan", "host_scan", inspector::AuditStatus::Started,
                                    "operator", "scan.Service");
    const auto second = audit.append("C1", "dev-1", "scan", "host_scan", inspector::AuditStatus::Success,
                                     "operator", "scan.Service", nlohmann::json{{"artifacts", 3}});
    QCOMPARE(QString::fromStdString(second.chainPrevHash), QString::fromStdString(first.chainHash));
    QVERIFY(second.occurredAt >= first.occurredAt);
    QVERIFY(second.eventId > first.eventId);

    const auto events = store.listAuditEvents("C1", 0);
    QCOMPARE(events.size(), static_cast<std::size_t>(2));
    QCOMPARE(QString::fromStdString(events[1].eventId), QString::fromStdString(second.eventId));
    QVERIFY(inspector::walkAuditChain("C1", events).ok());
}

void AuditChainTests::testDetailStoredAsHashedBytes()
{
    inspector::CaseStore store(m_tempDir.filePath(QStringLiteral("detail/inspector.db")).toStdString());
    inspector::AuditChain audit(store);

    const nlohmann::json detail = {{"b", 2}, {"a", "x"}, {"nested", {{"k", true}}}};
    const auto event = audit.append("C1", "", "export", "forensic_zip", inspector::AuditStatus::Success,
                                    "operator", "export.Service", detail);
    QCOMPARE(QString::fromStdString(event.detailJson), QString::fromStdString(detail.dump()));

    const auto stored = store.listAuditEvents("C1", 0).front();
    QCOMPARE(QString::fromStdString(stored.detailJson), QString::fromStdString(event.detailJson));
    QCOMPARE(QString::fromStdString(inspector::AuditChain::computeChainHash(stored)),
             QString::fromStdString(stored.chainHash));

    const auto nullDetail = audit.append("C1", "", "export", "forensic_zip", inspector::AuditStatus::Failed,
                                         "operator", "export.Service", nlohmann::json());
    QCOMPARE(QString::fromStdString(nullDetail.detailJson), QStringLiteral("{}"));
}

void AuditChainTests::testCasesHaveIndependentChains()
{
    inspector::CaseStore store(m_tempDir.filePath(QStringLiteral("cases/inspector.db")).toStdString());
    inspector::AuditChain audit(store);

    audit.append("A", "", "scan", "host_scan", inspector::AuditStatus::Started, "op", "scan.Service");
    const auto b1 = audit.append("B", "", "scan", "host_scan", inspector::AuditStatus::Started, "op",
                                 "scan.Service");
    audit.append("A", "", "scan", "host_scan", inspector::AuditStatus::Success, "op", "scan.Service");

    QVERIFY(b1.chainPrevHash.empty());
    QVERIFY(inspector::walkAuditChain("A", store.listAuditEvents("A", 0)).ok());
    QVERIFY(inspector::walkAuditChain("B", store.listAuditEvents("B", 0)).ok());
    // Per-case locks are released once no append is using them.
    QCOMPARE(audit.lockedCaseCount(), static_cast<std::size_t>(0));
}

void AuditChainTests::testConcurrentAppendsFormSingleChain()
{
    inspector::CaseStore store(m_tempDir.filePath(QStringLiteral("threads/inspector.db")).toStdString());
    inspector::AuditChain audit(store);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&audit, &failures, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                try {
                    audit.append("C1", "", "collect", "installed_apps", inspector::AuditStatus::Success,
                                 "worker-" + std::to_string(t), "collect.Worker",
                                 nlohmann::json{{"i", i}});
                } catch (const inspector::InspectorError &) {
                    ++failures;
                }
            }
        });
    }
    for (auto &worker : workers) {
        worker.join();
    }
    QCOMPARE(failures.load(), 0);
    QCOMPARE(audit.lockedCaseCount(), static_cast<std::size_t>(0));

    const auto events = store.listAuditEvents("C1", 0);
    QCOMPARE(events.size(), static_cast<std::size_t>(kThreads * kPerThread));

    std::set<std::string> prevs;
    for (const auto &event : events) {
        prevs.insert(event.chainPrevHash);
    }
    QCOMPARE(prevs.size(), events.size());

    const auto report = inspector::walkAuditChain("C1", events);
    QVERIFY(report.ok());
    QCOMPARE(QString::fromStdString(report.lastChainHash),
             QString::fromStdString(store.latestAuditTail("C1")->chainHash));
}

void AuditChainTests::testConcurrentConnectionsFormSingleChain()
{
    const std::string dbPath = m_tempDir.filePath(QStringLiteral("conns/inspector.db")).toStdString();
    inspector::CaseStore first(dbPath);
    inspector::CaseStore second(dbPath);
    inspector::AuditChain auditA(first);
    inspector::AuditChain auditB(second);

    auto run = [](inspector::AuditChain &audit, std::atomic<int> &failures) {
        for (int i = 0; i < 20; ++i) {
            try {
                audit.append("C1", "", "scan", "host_scan", inspector::AuditStatus::Success, "op",
                             "scan.Service", nlohmann::json{{"i", i}});
            } catch (const inspector::InspectorError &) {
                ++failures;
            }
        }
    };

    std::atomic<int> failures{0};
    std::thread a([&]() { run(auditA, failures); });
    std::thread b([&]() { run(auditB, failures); });
    a.join();
    b.join();
    QCOMPARE(failures.load(), 0);

    const auto events = first.listAuditEvents("C1", 0);
    QCOMPARE(events.size(), static_cast<std::size_t>(40));
    QVERIFY(inspector::walkAuditChain("C1", events).ok());
}

void AuditChainTests::testWalkAcceptsIntactChain()
{
    const auto events = buildChain(5);
    const auto report = inspector::walkAuditChain("C1", events);
    QVERIFY(report.ok());
    QCOMPARE(report.total, 5);
    QCOMPARE(QString::fromStdString(report.lastChainHash), QString::fromStdString(events.back().chainHash));

    QVERIFY(inspector::walkAuditChain("C1", {}).ok());
}

void AuditChainTests::testWalkFlagsEditedDetailAtItsIndexOnly()
{
    auto events = buildChain(5);
    events[2].detailJson = "{\"step\":99}";

    const auto report = inspector::walkAuditChain("C1", events);
    QCOMPARE(report.failed, 1);
    QCOMPARE(report.chainHashFailed, 1);
    QCOMPARE(report.prevHashFailed, 0);
    QCOMPARE(report.failures.front().index, 2);
    QVERIFY(report.failures.front().chainHashMismatch);
    QVERIFY(!report.failures.front().prevHashMismatch);
}

void AuditChainTests::testWalkFlagsRewrittenChainHashAndSuccessor()
{
    auto events = buildChain(5);
    events[1].chainHash = std::string(64, 'a');

    const auto report = inspector::walkAuditChain("C1", events);
    QCOMPARE(report.failed, 2);
    QCOMPARE(report.failures[0].index, 1);
    QVERIFY(report.failures[0].chainHashMismatch);
    QCOMPARE(report.failures[1].index, 2);
    QVERIFY(report.failures[1].prevHashMismatch);
    QVERIFY(!report.failures[1].chainHashMismatch);
    QCOMPARE(QString::fromStdString(report.failures[1].expectedPrevHash), QString(64, QLatin1Char('a')));
}

void AuditChainTests::testWalkFlagsRemovedEvent()
{
    auto events = buildChain(5);
    events.erase(events.begin() + 2);

    const auto report = inspector::walkAuditChain("C1", events);
    QCOMPARE(report.failed, 1);
    QCOMPARE(report.failures.front().index, 2);
    QCOMPARE(QString::fromStdString(report.failures.front().eventId), QStringLiteral("evt_3"));
    QVERIFY(report.failures.front().prevHashMismatch);
    QVERIFY(!report.failures.front().chainHashMismatch);
}

void AuditChainTests::testRaiseIfFailedPicksErrorKind()
{
    inspector::raiseIfFailed(inspector::walkAuditChain("C1", buildChain(3)));

    auto removed = buildChain(3);
    removed.erase(removed.begin() + 1);
    QVERIFY_THROWS_EXCEPTION(inspector::ChainDiscontinuityError,
                             inspector::raiseIfFailed(inspector::walkAuditChain("C1", removed)));

    auto edited = buildChain(3);
    edited[0].action = "other";
    QVERIFY_THROWS_EXCEPTION(inspector::ChainTamperError,
                             inspector::raiseIfFailed(inspector::walkAuditChain("C1", edited)));
}

QTEST_MAIN(AuditChainTests)
#include "test_audit_chain.moc"
