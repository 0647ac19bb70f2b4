#include <QtTest/QtTest>

#include <QStandardPaths>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fake_cluster_client.hpp"
#include "kubernetes/diff_utils.hpp"
#include "kubernetes/subset_differ.hpp"

using krecon::testing::FakeClusterClient;
using krecon::testing::makeManifest;

namespace {

struct RecordedDiff {
    std::string label;
    std::string live;
    std::string merged;
};

// Records its inputs and reports a change whenever the texts differ.
struct RecordingTextDiffer {
    std::shared_ptr<std::vector<RecordedDiff>> calls = std::make_shared<std::vector<RecordedDiff>>();

    std::optional<std::string> operator()(const std::string &label,
                                          const std::string &live,
                                          const std::string &merged) const
    {
        calls->push_back({label, live, merged});
        if (live == merged) {
            return std::nullopt;
        }
        return "changed " + label + "\n";
    }
};

} // namespace

class SubsetDifferTests : public QObject
{
    Q_OBJECT
private slots:
    void testSubsetKeepsCommonKeys();
    void testSubsetArrays();
    void testSubsetScalarsKeepLiveValue();
    void testUnchangedResourceHasNoDiff();
    void testChangedResource();
    void testMissingLiveObject();
    void testOnlyChangedResourcesReported();
    void testUnifiedDiff();
};

void SubsetDifferTests::testSubsetKeepsCommonKeys()
{
    const auto live = nlohmann::json::parse(R"({
        "metadata": {"name": "api", "uid": "abc", "resourceVersion": "7"},
        "spec": {"replicas": 3, "strategy": {"type": "RollingUpdate"}},
        "status": {"readyReplicas": 3}
    })");
    const auto desired = nlohmann::json::parse(R"({
        "metadata": {"name": "api", "labels": {"app": "api"}},
        "spec": {"replicas": 2}
    })");

    const auto expected = nlohmann::json::parse(R"({
        "metadata": {"name": "api"},
        "spec": {"replicas": 3}
    })");
    QCOMPARE(QString::fromStdString(krecon::subsetOf(live, desired).dump()),
             QString::fromStdString(expected.dump()));
}

void SubsetDifferTests::testSubsetArrays()
{
    const auto live = nlohmann::json::parse(R"({
        "ports": [
            {"port": 80, "protocol": "TCP", "targetPort": 8080},
            {"port": 443, "protocol": "TCP"}
        ]
    })");
    const auto desired = nlohmann::json::parse(R"({"ports": [{"port": 80}]})");

    const auto expected = nlohmann::json::parse(R"({"ports": [{"port": 80}]})");
    QCOMPARE(QString::fromStdString(krecon::subsetOf(live, desired).dump()),
             QString::fromStdString(expected.dump()));

    // Desired longer than live: only the common prefix survives.
    const auto shortLive = nlohmann::json::parse(R"({"args": ["a"]})");
    const auto longDesired = nlohmann::json::parse(R"({"args": ["a", "b"]})");
    QCOMPARE(QString::fromStdString(krecon::subsetOf(shortLive, longDesired).dump()),
             QStringLiteral("{\"args\":[\"a\"]}"));
}

void SubsetDifferTests::testSubsetScalarsKeepLiveValue()
{
    QCOMPARE(QString::fromStdString(krecon::subsetOf(nlohmann::json(5), nlohmann::json(2)).dump()),
             QStringLiteral("5"));

    // Type mismatch: the live value is kept whole.
    const auto live = nlohmann::json::parse(R"({"data": {"a": "1"}})");
    const auto desired = nlohmann::json::parse(R"({"data": "flat"})");
    QCOMPARE(QString::fromStdString(krecon::subsetOf(live, desired).dump()),
             QStringLiteral("{\"data\":{\"a\":\"1\"}}"));
}

void SubsetDifferTests::testUnchangedResourceHasNoDiff()
{
    auto client = std::make_shared<FakeClusterClient>(krecon::testing::makeInfo(1, 12, 0));
    const auto desired = makeManifest("Deployment", "api", "prod", {{"replicas", 2}});

    // Server-managed fields on the live object do not count as changes.
    nlohmann::json liveDoc = desired.raw();
    liveDoc["metadata"]["uid"] = "abc";
    liveDoc["status"] = {{"readyReplicas", 2}};
    client->addLive(krecon::Manifest::fromJson(liveDoc));

    RecordingTextDiffer recorder;
    const auto differ = krecon::makeSubsetDiffer(client, recorder);
    QVERIFY(!differ({desired}).has_value());
    QCOMPARE(static_cast<int>(recorder.calls->size()), 1);
    QCOMPARE(QString::fromStdString(recorder.calls->front().label),
             QStringLiteral("v1.Deployment.prod.api"));
}

void SubsetDifferTests::testChangedResource()
{
    auto client = std::make_shared<FakeClusterClient>();
    client->addLive(makeManifest("Deployment", "api", "prod", {{"replicas", 3}}));
    const auto desired = makeManifest("Deployment", "api", "prod", {{"replicas", 2}});

    RecordingTextDiffer recorder;
    const auto result = krecon::makeSubsetDiffer(client, recorder)({desired});
    QVERIFY(result.has_value());
    QCOMPARE(QString::fromStdString(*result), QStringLiteral("changed v1.Deployment.prod.api\n"));

    const RecordedDiff &call = recorder.calls->front();
    QVERIFY(QString::fromStdString(call.live).contains(QStringLiteral("\"replicas\": 3")));
    QVERIFY(QString::fromStdString(call.merged).contains(QStringLiteral("\"replicas\": 2")));
}

void SubsetDifferTests::testMissingLiveObject()
{
    auto client = std::make_shared<FakeClusterClient>();
    const auto desired = makeManifest("ClusterRole", "reader", "");

    RecordingTextDiffer recorder;
    const auto result = krecon::makeSubsetDiffer(client, recorder)({desired});
    QVERIFY(result.has_value());
    QVERIFY(recorder.calls->front().live.empty());
    QCOMPARE(QString::fromStdString(recorder.calls->front().label),
             QStringLiteral("v1.ClusterRole.reader"));
}

void SubsetDifferTests::testOnlyChangedResourcesReported()
{
    auto client = std::make_shared<FakeClusterClient>();
    const auto same = makeManifest("ConfigMap", "settings", "prod", {{"a", 1}});
    client->addLive(same);
    client->addLive(makeManifest("Service", "api", "prod", {{"port", 80}}));

    const krecon::ManifestList state = {
        same,
        makeManifest("Service", "api", "prod", {{"port", 8080}}),
        makeManifest("Secret", "token", "prod"),
    };

    RecordingTextDiffer recorder;
    const auto result = krecon::makeSubsetDiffer(client, recorder)(state);
    QVERIFY(result.has_value());
    QCOMPARE(QString::fromStdString(*result),
             QStringLiteral("changed v1.Service.prod.api\nchanged v1.Secret.prod.token\n"));
    QCOMPARE(static_cast<int>(recorder.calls->size()), 3);
}

void SubsetDifferTests::testUnifiedDiff()
{
    if (QStandardPaths::findExecutable(QStringLiteral("diff")).isEmpty()) {
        QSKIP("diff(1) is not installed");
    }

    QVERIFY(!krecon::unifiedDiff("v1.Pod.a", "same\n", "same\n").has_value());

    const auto diff = krecon::unifiedDiff("v1.Pod.a", "replicas: 1\n", "replicas: 2\n");
    QVERIFY(diff.has_value());
    const QString text = QString::fromStdString(*diff);
    QVERIFY(text.contains(QStringLiteral("--- LIVE/v1.Pod.a")));
    QVERIFY(text.contains(QStringLiteral("+++ MERGED/v1.Pod.a")));
    QVERIFY(text.contains(QStringLiteral("-replicas: 1")));
    QVERIFY(text.contains(QStringLiteral("+replicas: 2")));

    const auto added = krecon::unifiedDiff("v1.Pod.b", "", "kind: Pod\n");
    QVERIFY(added.has_value());
    QVERIFY(QString::fromStdString(*added).contains(QStringLiteral("+kind: Pod")));
}

QTEST_MAIN(SubsetDifferTests)
#include "test_subset_differ.moc"
