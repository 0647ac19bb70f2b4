#include <QtTest/QtTest>

#include <QElapsedTimer>

#include <algorithm>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "common/errors.hpp"
#include "fake_cluster_client.hpp"
#include "kubernetes/orphan_detector.hpp"

using krecon::ResourceIdentifier;
using krecon::testing::FakeClusterClient;
using krecon::testing::makeManifest;

class OrphanDetectorTests : public QObject
{
    Q_OBJECT
private slots:
    void testDefaultKinds();
    void testWorkerLeftOutOfDesiredState();
    void testDisjointStates();
    void testDesiredEqualsLive();
    void testEmptyDesiredState();
    void testNamespaceAndLabelsForwarded();
    void testEveryKindQueriedDespiteFailure();
    void testLastFailureReported();
    void testTimeout();
    void testNoTimeoutByDefault();
    void testNoKinds();

private:
    static std::set<ResourceIdentifier> ids(const krecon::ManifestList &list);
    static krecon::OrphanQuery query(std::vector<std::string> kinds);
};

std::set<ResourceIdentifier> OrphanDetectorTests::ids(const krecon::ManifestList &list)
{
    std::set<ResourceIdentifier> result;
    for (const auto &manifest : list) {
        result.insert(manifest.identifier());
    }
    return result;
}

krecon::OrphanQuery OrphanDetectorTests::query(std::vector<std::string> kinds)
{
    krecon::OrphanQuery q;
    q.namespaceName = "prod";
    q.labels = {{"krecon.dev/environment", "prod"}};
    q.kinds = std::move(kinds);
    return q;
}

void OrphanDetectorTests::testDefaultKinds()
{
    const auto &kinds = krecon::defaultOrphanKinds();
    QCOMPARE(static_cast<int>(kinds.size()), 21);
    QCOMPARE(QString::fromStdString(kinds.front()), QStringLiteral("ConfigMap"));
    QCOMPARE(QString::fromStdString(kinds.back()), QStringLiteral("RoleBinding"));
    QVERIFY(std::find(kinds.begin(), kinds.end(), "Deployment") != kinds.end());
    QVERIFY(std::find(kinds.begin(), kinds.end(), "ClusterRoleBinding") != kinds.end());

    const std::set<std::string> unique(kinds.begin(), kinds.end());
    QCOMPARE(static_cast<int>(unique.size()), 21);
}

void OrphanDetectorTests::testWorkerLeftOutOfDesiredState()
{
    auto client = std::make_shared<FakeClusterClient>();
    client->addLive(makeManifest("Deployment", "api", "prod"));
    client->addLive(makeManifest("Deployment", "worker", "prod"));
    client->addLive(makeManifest("Service", "api", "prod"));

    const krecon::ManifestList desired = {
        makeManifest("Deployment", "api", "prod", {{"replicas", 4}}),
        makeManifest("Service", "api", "prod"),
    };

    krecon::OrphanDetector detector(client);
    const auto orphans = detector.listOrphaned(desired, query({"Deployment", "Service"}));

    QCOMPARE(static_cast<int>(orphans.size()), 1);
    QVERIFY(orphans.front().identifier() == (ResourceIdentifier{"Deployment", "worker", "prod"}));
}

void OrphanDetectorTests::testDisjointStates()
{
    auto client = std::make_shared<FakeClusterClient>();
    client->addLive(makeManifest("ConfigMap", "old-settings", "prod"));
    client->addLive(makeManifest("Secret", "old-token", "prod"));

    const krecon::ManifestList desired = {makeManifest("ConfigMap", "settings", "prod")};

    krecon::OrphanDetector detector(client);
    const auto orphans = detector.listOrphaned(desired, query({"ConfigMap", "Secret", "Pod"}));

    const std::set<ResourceIdentifier> expected = {
        {"ConfigMap", "old-settings", "prod"},
        {"Secret", "old-token", "prod"},
    };
    QVERIFY(ids(orphans) == expected);
}

void OrphanDetectorTests::testDesiredEqualsLive()
{
    auto client = std::make_shared<FakeClusterClient>();
    const krecon::ManifestList live = {
        makeManifest("Role", "reader", "prod"),
        makeManifest("RoleBinding", "reader", "prod"),
    };
    for (const auto &manifest : live) {
        client->addLive(manifest);
    }

    krecon::OrphanDetector detector(client);
    QVERIFY(detector.listOrphaned(live, query({"Role", "RoleBinding"})).empty());
}

void OrphanDetectorTests::testEmptyDesiredState()
{
    auto client = std::make_shared<FakeClusterClient>();
    client->addLive(makeManifest("Job", "migrate", "prod"));
    client->addLive(makeManifest("CronJob", "cleanup", "prod"));

    krecon::OrphanDetector detector(client);
    const auto orphans = detector.listOrphaned({}, query({"Job", "CronJob"}));
    QCOMPARE(static_cast<int>(orphans.size()), 2);
}

void OrphanDetectorTests::testNamespaceAndLabelsForwarded()
{
    auto client = std::make_shared<FakeClusterClient>();

    krecon::OrphanDetector detector(client);
    detector.listOrphaned({}, query({"Pod"}));

    QCOMPARE(QString::fromStdString(client->lastNamespace()), QStringLiteral("prod"));
    const auto labels = client->lastLabels();
    QCOMPARE(static_cast<int>(labels.size()), 1);
    QCOMPARE(QString::fromStdString(labels.at("krecon.dev/environment")), QStringLiteral("prod"));
}

void OrphanDetectorTests::testEveryKindQueriedDespiteFailure()
{
    auto client = std::make_shared<FakeClusterClient>();
    client->addLive(makeManifest("Service", "stale", "prod"));
    client->failKind("Ingress", "the server could not find the requested resource");

    krecon::OrphanDetector detector(client);
    const auto &kinds = krecon::defaultOrphanKinds();

    bool failed = false;
    try {
        detector.listOrphaned({}, query(kinds));
    } catch (const krecon::CategoryQueryFailed &ex) {
        failed = true;
        QCOMPARE(QString::fromStdString(ex.category()), QStringLiteral("Ingress"));
        QVERIFY(QString::fromStdString(ex.cause()).contains(QStringLiteral("could not find")));
    }
    QVERIFY(failed);

    // The failure does not cancel the other queries, and the partial result
    // containing Service/prod/stale is discarded.
    for (const auto &kind : kinds) {
        QCOMPARE(client->queriesFor(kind), 1);
    }
    QCOMPARE(client->totalQueries(), static_cast<int>(kinds.size()));
}

void OrphanDetectorTests::testLastFailureReported()
{
    auto client = std::make_shared<FakeClusterClient>();
    client->failKind("Pod", "forbidden");
    client->failKind("Secret", "forbidden");

    krecon::OrphanDetector detector(client);

    bool failed = false;
    try {
        detector.listOrphaned({}, query({"Pod", "Secret", "ConfigMap"}));
    } catch (const krecon::CategoryQueryFailed &ex) {
        failed = true;
        const QString category = QString::fromStdString(ex.category());
        QVERIFY(category == QStringLiteral("Pod") || category == QStringLiteral("Secret"));
        QVERIFY(QString::fromUtf8(ex.what()).startsWith(QStringLiteral("getting orphans of kind '")));
    }
    QVERIFY(failed);
    QCOMPARE(client->totalQueries(), 3);
}

void OrphanDetectorTests::testTimeout()
{
    auto client = std::make_shared<FakeClusterClient>();
    client->hangKind("StatefulSet");

    krecon::OrphanQuery q = query({"Deployment", "StatefulSet"});
    q.timeout = std::chrono::milliseconds(100);

    krecon::OrphanDetector detector(client);
    QElapsedTimer timer;
    timer.start();
    QVERIFY_EXCEPTION_THROWN(detector.listOrphaned({}, q), krecon::OrphanQueryTimeout);
    QVERIFY(timer.elapsed() < 5000);

    // The scan returns only after the hanging query gave up on its deadline.
    QCOMPARE(client->inFlight(), 0);
    QCOMPARE(client->queriesFor("StatefulSet"), 1);
    QVERIFY(client->lastTimeout().has_value());
    QVERIFY(*client->lastTimeout() <= std::chrono::milliseconds(100));
}

void OrphanDetectorTests::testNoTimeoutByDefault()
{
    auto client = std::make_shared<FakeClusterClient>();

    krecon::OrphanDetector detector(client);
    detector.listOrphaned({}, query({"Pod"}));
    QVERIFY(!client->lastTimeout().has_value());
    QCOMPARE(client->inFlight(), 0);
}

void OrphanDetectorTests::testNoKinds()
{
    auto client = std::make_shared<FakeClusterClient>();
    client->addLive(makeManifest("Pod", "a", "prod"));

    krecon::OrphanDetector detector(client);
    QVERIFY(detector.listOrphaned({}, query({})).empty());
    QCOMPARE(client->totalQueries(), 0);
}

QTEST_MAIN(OrphanDetectorTests)
#include "test_orphan_detector.moc"
