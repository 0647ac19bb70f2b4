#include "kubernetes/orphan_detector.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <utility>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace krecon {

namespace {

struct KindOutcome {
    std::string kind;
    bool ok = false;
    bool timedOut = false;
    ManifestList manifests;
    std::string cause;
};

// Outcome queue between the workers and the collecting thread. The collector
// joins every worker before the queue goes out of scope.
class FanIn
{
public:
    void post(KindOutcome outcome)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_outcomes.push_back(std::move(outcome));
        }
        m_ready.notify_one();
    }

    // Returns false when the deadline passed before an outcome arrived.
    bool take(KindOutcome &outcome,
              const std::optional<std::chrono::steady_clock::time_point> &deadline)
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        const auto available = [this] { return !m_outcomes.empty(); };
        if (deadline.has_value()) {
            if (!m_ready.wait_until(lock, *deadline, available)) {
                return false;
            }
        } else {
            m_ready.wait(lock, available);
        }
        outcome = std::move(m_outcomes.front());
        m_outcomes.pop_front();
        return true;
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_ready;
    std::deque<KindOutcome> m_outcomes;
};

void joinAll(std::vector<std::thread> &workers)
{
    for (auto &worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// Time a worker may still spend on its query. Never zero, so a late worker
// still fails with a timeout instead of blocking.
std::optional<std::chrono::milliseconds>
remainingUntil(const std::optional<std::chrono::steady_clock::time_point> &deadline)
{
    if (!deadline.has_value()) {
        return std::nullopt;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(1));
}

} // namespace

const std::vector<std::string> &defaultOrphanKinds()
{
    static const std::vector<std::string> kinds = {
        // core
        "ConfigMap",
        "Endpoints",
        "Namespace",
        "PersistentVolumeClaim",
        "PersistentVolume",
        "Pod",
        "ReplicationController",
        "Secret",
        "ServiceAccount",
        "Service",

        // apps
        "DaemonSet",
        "Deployment",
        "ReplicaSet",
        "StatefulSet",

        // batch
        "Job",
        "CronJob",

        "Ingress",

        // rbac
        "ClusterRole",
        "ClusterRoleBinding",
        "Role",
        "RoleBinding",
    };
    return kinds;
}

OrphanDetector::OrphanDetector(std::shared_ptr<ClusterClient> client)
    : m_client(std::move(client))
{
}

ManifestList OrphanDetector::listOrphaned(const ManifestList &desired,
                                          const OrphanQuery &query) const
{
    std::unordered_set<ResourceIdentifier> known;
    for (const auto &manifest : desired) {
        known.insert(manifest.identifier());
    }

    KLOG_DEBUG(QStringLiteral("OrphanDetector"),
               QStringLiteral("listOrphaned"),
               QStringLiteral("orphan_scan_start"),
               QStringLiteral("user_command"),
               QStringLiteral("fan_out"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"kinds", query.kinds.size()},
                              {"known", known.size()},
                              {"namespace", query.namespaceName}});

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (query.timeout.has_value()) {
        deadline = std::chrono::steady_clock::now() + *query.timeout;
    }

    FanIn fanIn;
    const QString corrId = logging::currentCorrelationId();

    std::vector<std::thread> workers;
    workers.reserve(query.kinds.size());
    try {
        for (const auto &kind : query.kinds) {
            workers.emplace_back([client = m_client, &fanIn, kind, corrId, deadline,
                                  namespaceName = query.namespaceName,
                                  labels = query.labels]() {
                logging::CorrelationScope scope(corrId);
                KindOutcome outcome;
                outcome.kind = kind;
                try {
                    outcome.manifests = client->getByLabels(namespaceName, kind, labels,
                                                            remainingUntil(deadline));
                    outcome.ok = true;
                } catch (const CommandTimedOut &ex) {
                    outcome.timedOut = true;
                    outcome.cause = ex.what();
                } catch (const std::exception &ex) {
                    outcome.cause = ex.what();
                } catch (...) {
                    outcome.cause = "unknown error";
                }
                fanIn.post(std::move(outcome));
            });
        }
    } catch (const std::system_error &ex) {
        joinAll(workers);
        throw KreconError(std::string("cannot start orphan scan workers: ") + ex.what());
    }

    ManifestList orphaned;
    std::optional<CategoryQueryFailed> lastError;
    std::size_t received = 0;
    std::size_t timedOut = 0;
    while (received < workers.size()) {
        KindOutcome outcome;
        if (!fanIn.take(outcome, deadline)) {
            break;
        }
        ++received;

        if (outcome.timedOut) {
            ++timedOut;
            continue;
        }
        if (!outcome.ok) {
            KLOG_WARN(QStringLiteral("OrphanDetector"),
                      QStringLiteral("listOrphaned"),
                      QStringLiteral("orphan_kind_failed"),
                      QStringLiteral("cluster_error"),
                      QStringLiteral("fan_in"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"kind", outcome.kind},
                                     {"cause", outcome.cause}});
            lastError.emplace(outcome.kind, outcome.cause);
            continue;
        }

        for (auto &manifest : outcome.manifests) {
            if (known.count(manifest.identifier()) > 0) {
                continue;
            }
            orphaned.push_back(std::move(manifest));
        }
    }

    // Every query carries the deadline, so the outstanding workers end by it.
    joinAll(workers);

    const std::size_t answered = received - timedOut;
    if (timedOut > 0 || received < workers.size()) {
        const long long timeoutMs = query.timeout.has_value() ? query.timeout->count() : 0;
        KLOG_ERROR(QStringLiteral("OrphanDetector"),
                   QStringLiteral("listOrphaned"),
                   QStringLiteral("orphan_scan_timeout"),
                   QStringLiteral("cluster_unresponsive"),
                   QStringLiteral("fan_in"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"answered", answered},
                                  {"kinds", workers.size()},
                                  {"timeoutMs", timeoutMs}});
        throw OrphanQueryTimeout("orphan scan timed out after "
                                 + std::to_string(timeoutMs) + "ms with "
                                 + std::to_string(answered) + " of "
                                 + std::to_string(workers.size()) + " kinds answered");
    }

    // A partial orphan list is not safe to act on.
    if (lastError.has_value()) {
        throw *lastError;
    }

    KLOG_INFO(QStringLiteral("OrphanDetector"),
              QStringLiteral("listOrphaned"),
              QStringLiteral("orphan_scan_done"),
              QStringLiteral("user_command"),
              QStringLiteral("fan_in"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"kinds", workers.size()},
                             {"orphans", orphaned.size()}});
    return orphaned;
}

} // namespace krecon
