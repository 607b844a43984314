#include <iostream>
#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>
#include "app/DemoCatalog.hpp"
#include "application/DataExporter.hpp"
#include "application/ExportAuthorizationGate.hpp"
#include "application/ExportJobOrchestrator.hpp"
#include "application/ExportProviderRegistry.hpp"
#include "application/ExportService.hpp"
#include "application/KnownExportTypesRegistry.hpp"
#include "domain/ExportErrors.hpp"
#include "infrastructure/CsvExportProvider.hpp"
#include "infrastructure/InMemoryPushNotificationHub.hpp"
#include "infrastructure/JsonExportProvider.hpp"
#include "infrastructure/LocalExportFileStorage.hpp"

using namespace exporthub;
using domain::ExportJobStatus;

namespace fs = std::filesystem;

namespace {

constexpr auto kWait = std::chrono::seconds(10);

/** Everything a request needs, wired the way the application host wires it. */
struct Harness {
    fs::path root;
    std::shared_ptr<infrastructure::LocalExportFileStorage> storage;
    std::shared_ptr<infrastructure::InMemoryPushNotificationHub> hub;
    std::shared_ptr<application::KnownExportTypesRegistry> types;
    std::shared_ptr<application::ExportProviderRegistry> providers;
    std::shared_ptr<application::ExportAuthorizationGate> gate;
    std::shared_ptr<application::ExportJobOrchestrator> orchestrator;
    std::shared_ptr<application::ExportService> service;

    explicit Harness(const std::string& name, int workers = 2, std::size_t retainedJobs = 1000) {
        root = fs::temp_directory_path() /
               ("exporthub_" + name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        storage = std::make_shared<infrastructure::LocalExportFileStorage>(root);
        hub = std::make_shared<infrastructure::InMemoryPushNotificationHub>(retainedJobs);
        types = std::make_shared<application::KnownExportTypesRegistry>();
        providers = std::make_shared<application::ExportProviderRegistry>();
        providers->registerFactory(&infrastructure::JsonExportProvider::Create);
        providers->registerFactory(&infrastructure::CsvExportProvider::Create);
        gate = std::make_shared<application::ExportAuthorizationGate>();

        auto exporter = std::make_shared<application::DataExporter>(types, providers, storage);
        application::ExportJobSettings settings;
        settings.workerCount = workers;
        settings.maxRetainedJobs = retainedJobs;
        orchestrator = std::make_shared<application::ExportJobOrchestrator>(
            hub,
            [exporter](const domain::ExportDataRequest& request, const std::string& baseName,
                       const application::ExportProgressCallback& progress, const application::CancellationToken& token) {
                return exporter->exportData(request, baseName, progress, token);
            },
            settings);
        service = std::make_shared<application::ExportService>(types, providers, gate, orchestrator, storage);
    }

    ~Harness() {
        orchestrator->stop();
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    /** Number of published files (the staging directory is not counted). */
    std::size_t publishedFiles() const {
        std::size_t count = 0;
        for (const auto& entry : fs::directory_iterator(root)) {
            if (entry.is_regular_file()) ++count;
        }
        return count;
    }

    std::size_t stagedFiles() const {
        std::size_t count = 0;
        for (const auto& entry : fs::directory_iterator(storage->stagingDir())) {
            (void)entry;
            ++count;
        }
        return count;
    }

    std::size_t terminalUpdates(const std::string& notificationId) const {
        std::size_t count = 0;
        for (const auto& update : hub->history(notificationId)) {
            if (domain::IsTerminal(update.status)) ++count;
        }
        return count;
    }

    bool sawStatus(const std::string& notificationId, ExportJobStatus status) const {
        for (const auto& update : hub->history(notificationId)) {
            if (update.status == status) return true;
        }
        return false;
    }
};

domain::Principal FullUser() {
    return {"alice", {domain::permissions::Access, domain::permissions::Download, "catalog:read", "order:read"}};
}

domain::ExportDataRequest ProductRequest() {
    domain::ExportDataRequest request;
    request.exportTypeName = "Catalog.Product";
    return request;
}

/** Latch shared between a test and a data source it wants to hold mid-export. */
struct PageLatch {
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;

    void enterAndWait() {
        std::unique_lock<std::mutex> lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [this] { return released; });
    }
    bool waitEntered() {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, kWait, [this] { return entered; });
    }
    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        cv.notify_all();
    }
};

class BlockingDataSource : public domain::PagedExportDataSource {
public:
    BlockingDataSource(domain::ExportDataQuery query, std::shared_ptr<PageLatch> latch)
        : PagedExportDataSource(std::move(query), 10), m_latch(std::move(latch)) {}

protected:
    domain::DataPage fetchData(std::size_t skip, std::size_t take) override {
        domain::DataPage page;
        page.totalCount = 100;
        if (take == 0) return page;
        m_latch->enterAndWait();
        for (std::size_t i = skip; i < skip + take && i < 100; ++i) {
            page.items.push_back(domain::ExportRecord{{"id", i}});
        }
        return page;
    }

private:
    std::shared_ptr<PageLatch> m_latch;
};

class FailingDataSource : public domain::PagedExportDataSource {
public:
    explicit FailingDataSource(domain::ExportDataQuery query) : PagedExportDataSource(std::move(query), 10) {}

protected:
    domain::DataPage fetchData(std::size_t skip, std::size_t take) override {
        if (take == 0) return domain::DataPage{{}, 30};
        if (skip >= 10) throw std::runtime_error("backend went away");
        domain::DataPage page;
        page.totalCount = 30;
        for (std::size_t i = 0; i < take; ++i) {
            page.items.push_back(domain::ExportRecord{{"id", skip + i}});
        }
        return page;
    }
};

void TestProductScenario() {
    std::cout << "[Test] Catalog.Product preview, run, download, late cancel..." << std::endl;
    Harness h("scenario");
    app::RegisterDemoTypes(*h.service, 50);
    assert(h.orchestrator->start());

    auto user = FullUser();
    auto preview = h.service->previewData(user, ProductRequest());
    assert(preview.totalCount == 250);
    assert(preview.results.size() == 50);
    assert(preview.results.front()["id"] == "product-0001");

    auto notification = h.service->runExport(user, ProductRequest());
    assert(notification.title == "Product export");
    assert(notification.creator == "alice");
    assert(!notification.jobId.empty());
    assert(notification.description == "Starting export task...");

    assert(h.orchestrator->waitIdle(std::chrono::duration_cast<std::chrono::milliseconds>(kWait)));

    auto latest = h.hub->find(notification.id);
    assert(latest);
    assert(latest->status == ExportJobStatus::Completed);
    assert(latest->jobId == notification.jobId);
    assert(latest->processedCount == 250);
    assert(latest->finished.has_value());
    assert(latest->downloadUrl == "api/export/download/" + latest->fileName);
    assert(latest->fileName == "Product_" + notification.jobId + ".json");
    assert(h.sawStatus(notification.id, ExportJobStatus::Running));
    assert(h.terminalUpdates(notification.id) == 1);

    // Progress updates carry the running totals.
    bool sawProgress = false;
    for (const auto& update : h.hub->history(notification.id)) {
        if (update.description == "50 of 250 have been exported") sawProgress = true;
    }
    assert(sawProgress);

    auto download = h.service->openDownload(user, latest->fileName);
    assert(download.info.contentType == "application/json");
    std::string content = download.read(0, static_cast<std::size_t>(download.info.size));
    auto parsed = nlohmann::json::parse(content);
    assert(parsed.is_array() && parsed.size() == 250);
    assert(download.info.size == content.size());

    auto historyBefore = h.hub->history(notification.id).size();
    h.service->cancelExport(user, notification.jobId);
    assert(h.hub->history(notification.id).size() == historyBefore);
    assert(h.orchestrator->status(notification.jobId) == ExportJobStatus::Completed);
    std::cout << "[PASS] Catalog.Product scenario." << std::endl;
}

void TestCsvProjectionRun() {
    std::cout << "[Test] CSV export with projection and window..." << std::endl;
    Harness h("csv");
    app::RegisterDemoTypes(*h.service, 50);
    assert(h.orchestrator->start());

    auto request = ProductRequest();
    request.providerName = "CsvExportProvider";
    request.dataQuery.includedProperties = {"id", "name"};
    request.dataQuery.skip = 10;
    request.dataQuery.take = 5;

    auto notification = h.service->runExport(FullUser(), request);
    assert(h.orchestrator->waitIdle(std::chrono::duration_cast<std::chrono::milliseconds>(kWait)));

    auto latest = h.hub->find(notification.id);
    assert(latest && latest->status == ExportJobStatus::Completed);
    assert(latest->processedCount == 5);

    auto download = h.service->openDownload(FullUser(), latest->fileName);
    assert(download.info.contentType == "text/csv");
    std::string content = download.read(0, static_cast<std::size_t>(download.info.size));
    assert(content ==
           "id,name\r\n"
           "product-0011,Product 11\r\n"
           "product-0012,Product 12\r\n"
           "product-0013,Product 13\r\n"
           "product-0014,Product 14\r\n"
           "product-0015,Product 15\r\n");
    std::cout << "[PASS] CSV run." << std::endl;
}

void TestDenialHasNoSideEffects() {
    std::cout << "[Test] Denied run/preview has no side effects..." << std::endl;
    Harness h("denial");
    std::atomic<int> factoryCalls{0};

    domain::ExportedTypeDefinition secret;
    secret.name = "Finance.Invoice";
    secret.requiredPermission = "finance:read";
    secret.dataSourceFactory = [&factoryCalls](const domain::ExportDataQuery& query) -> std::unique_ptr<domain::ExportDataSource> {
        ++factoryCalls;
        auto records = std::make_shared<std::vector<domain::ExportRecord>>();
        return std::make_unique<infrastructure::InMemoryExportDataSource>(records, query, 10);
    };
    h.service->registerExportType(secret);
    assert(h.orchestrator->start());

    domain::ExportDataRequest request;
    request.exportTypeName = "Finance.Invoice";
    domain::Principal user{"bob", {domain::permissions::Access}};

    bool denied = false;
    try {
        h.service->runExport(user, request);
    } catch (const domain::AuthorizationDeniedError& e) {
        denied = true;
        assert(std::string(e.what()) == "Unauthorized");
    }
    assert(denied);

    denied = false;
    try {
        h.service->previewData(user, request);
    } catch (const domain::AuthorizationDeniedError&) {
        denied = true;
    }
    assert(denied);

    // Base access missing entirely.
    denied = false;
    try {
        h.service->knownTypes(domain::Principal{"nobody", {}});
    } catch (const domain::AuthorizationDeniedError&) {
        denied = true;
    }
    assert(denied);

    assert(factoryCalls.load() == 0);
    assert(h.hub->size() == 0);
    assert(h.orchestrator->queueSize() == 0);
    assert(h.publishedFiles() == 0);
    std::cout << "[PASS] Denial side effects." << std::endl;
}

void TestUnknownTypeAndProvider() {
    std::cout << "[Test] Unknown type or provider fails without a job..." << std::endl;
    Harness h("unknown");
    app::RegisterDemoTypes(*h.service, 50);

    domain::ExportDataRequest request;
    request.exportTypeName = "Nope.Type";
    bool threw = false;
    try {
        h.service->runExport(FullUser(), request);
    } catch (const domain::UnknownExportTypeError&) {
        threw = true;
    }
    assert(threw);

    request = ProductRequest();
    request.providerName = "PdfExportProvider";
    threw = false;
    try {
        h.service->runExport(FullUser(), request);
    } catch (const domain::UnknownExportProviderError&) {
        threw = true;
    }
    assert(threw);

    assert(h.hub->size() == 0);
    assert(h.orchestrator->queueSize() == 0);
    std::cout << "[PASS] Unknown type/provider." << std::endl;
}

void TestCancelBeforePickup() {
    std::cout << "[Test] Cancel before a worker picks the job up..." << std::endl;
    Harness h("queued_cancel");
    app::RegisterDemoTypes(*h.service, 50);

    // Workers are not started, so the job stays queued.
    auto notification = h.service->runExport(FullUser(), ProductRequest());
    assert(h.orchestrator->queueSize() == 1);
    assert(h.orchestrator->status(notification.jobId) == ExportJobStatus::Queued);

    h.service->cancelExport(FullUser(), notification.jobId);
    assert(h.orchestrator->queueSize() == 0);
    assert(h.orchestrator->status(notification.jobId) == ExportJobStatus::Cancelled);

    // Cancelling again and cancelling unknown ids are silent no-ops.
    h.service->cancelExport(FullUser(), notification.jobId);
    h.service->cancelExport(FullUser(), "no-such-job");

    assert(h.orchestrator->start());
    assert(h.orchestrator->waitIdle(std::chrono::duration_cast<std::chrono::milliseconds>(kWait)));

    assert(!h.sawStatus(notification.id, ExportJobStatus::Running));
    assert(h.terminalUpdates(notification.id) == 1);
    auto latest = h.hub->find(notification.id);
    assert(latest && latest->status == ExportJobStatus::Cancelled);
    assert(latest->description == "Export was cancelled by the user");
    assert(h.publishedFiles() == 0);
    std::cout << "[PASS] Cancel before pickup." << std::endl;
}

void TestCancelWhileRunning() {
    std::cout << "[Test] Cancel a running job at a page boundary..." << std::endl;
    Harness h("running_cancel", 1);
    auto latch = std::make_shared<PageLatch>();

    domain::ExportedTypeDefinition slow;
    slow.name = "Slow.Record";
    slow.dataSourceFactory = [latch](const domain::ExportDataQuery& query) -> std::unique_ptr<domain::ExportDataSource> {
        return std::make_unique<BlockingDataSource>(query, latch);
    };
    h.service->registerExportType(slow);
    assert(h.orchestrator->start());

    domain::ExportDataRequest request;
    request.exportTypeName = "Slow.Record";
    auto notification = h.service->runExport(FullUser(), request);

    assert(latch->waitEntered());
    assert(h.orchestrator->status(notification.jobId) == ExportJobStatus::Running);
    h.service->cancelExport(FullUser(), notification.jobId);
    latch->release();

    assert(h.orchestrator->waitIdle(std::chrono::duration_cast<std::chrono::milliseconds>(kWait)));

    auto latest = h.hub->find(notification.id);
    assert(latest && latest->status == ExportJobStatus::Cancelled);
    assert(latest->fileName.empty());
    assert(h.terminalUpdates(notification.id) == 1);
    assert(h.publishedFiles() == 0);
    assert(h.stagedFiles() == 0);
    std::cout << "[PASS] Cancel while running." << std::endl;
}

void TestFailedJobPublishesNothing() {
    std::cout << "[Test] A failing data source fails the job without output..." << std::endl;
    Harness h("failure");

    domain::ExportedTypeDefinition broken;
    broken.name = "Broken.Record";
    broken.dataSourceFactory = [](const domain::ExportDataQuery& query) -> std::unique_ptr<domain::ExportDataSource> {
        return std::make_unique<FailingDataSource>(query);
    };
    h.service->registerExportType(broken);
    assert(h.orchestrator->start());

    domain::ExportDataRequest request;
    request.exportTypeName = "Broken.Record";
    auto notification = h.service->runExport(FullUser(), request);
    assert(h.orchestrator->waitIdle(std::chrono::duration_cast<std::chrono::milliseconds>(kWait)));

    auto latest = h.hub->find(notification.id);
    assert(latest && latest->status == ExportJobStatus::Failed);
    assert(latest->description == "Export failed");
    assert(latest->errorCount == 1);
    assert(latest->errors.front() == "backend went away");
    assert(latest->processedCount == 10);
    assert(h.terminalUpdates(notification.id) == 1);
    assert(h.publishedFiles() == 0);
    assert(h.stagedFiles() == 0);
    std::cout << "[PASS] Failed job." << std::endl;
}

void TestConcurrentRunsEachTerminateOnce() {
    std::cout << "[Test] Concurrent runs each get exactly one terminal update..." << std::endl;
    Harness h("concurrent", 3);
    app::RegisterDemoTypes(*h.service, 50);
    assert(h.orchestrator->start());

    const int kRuns = 12;
    std::vector<std::thread> threads;
    std::mutex idsMutex;
    std::vector<domain::ExportNotification> accepted;
    for (int i = 0; i < kRuns; ++i) {
        threads.emplace_back([&h, &idsMutex, &accepted, i]() {
            domain::ExportDataRequest request;
            request.exportTypeName = (i % 2 == 0) ? "Catalog.Product" : "Orders.CustomerOrder";
            auto notification = h.service->runExport(FullUser(), request);
            std::lock_guard<std::mutex> lock(idsMutex);
            accepted.push_back(notification);
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    assert(h.orchestrator->waitIdle(std::chrono::duration_cast<std::chrono::milliseconds>(kWait)));
    assert(accepted.size() == static_cast<std::size_t>(kRuns));

    std::set<std::string> jobIds;
    for (const auto& notification : accepted) {
        jobIds.insert(notification.jobId);
        assert(h.terminalUpdates(notification.id) == 1);
        auto latest = h.hub->find(notification.id);
        assert(latest && latest->status == ExportJobStatus::Completed);

        // Transition order: Queued first, terminal last.
        auto history = h.hub->history(notification.id);
        assert(history.front().status == ExportJobStatus::Queued);
        assert(domain::IsTerminal(history.back().status));
    }
    assert(jobIds.size() == static_cast<std::size_t>(kRuns));
    assert(h.publishedFiles() == static_cast<std::size_t>(kRuns));
    std::cout << "[PASS] Concurrent runs." << std::endl;
}

void TestDownloadPermissions() {
    std::cout << "[Test] Download requires platform:export or export:download..." << std::endl;
    Harness h("download_perm");

    {
        auto writer = h.storage->openWrite("report.txt");
        writer->stream() << "hello";
        writer->publish();
    }

    domain::Principal platform{"admin", {domain::permissions::PlatformExport}};
    auto download = h.service->openDownload(platform, "report.txt");
    assert(download.info.contentType == "text/plain");
    assert(download.info.size == 5);
    assert(download.read(1, 3) == "ell");
    assert(download.read(3, 64) == "lo");
    assert(download.read(10, 4).empty());

    bool denied = false;
    try {
        h.service->openDownload(domain::Principal{"bob", {domain::permissions::Access}}, "report.txt");
    } catch (const domain::AuthorizationDeniedError&) {
        denied = true;
    }
    assert(denied);

    bool missing = false;
    try {
        h.service->openDownload(platform, "absent.json");
    } catch (const domain::FileNotFoundError&) {
        missing = true;
    }
    assert(missing);

    bool invalid = false;
    try {
        h.service->openDownload(platform, "../etc/passwd");
    } catch (const domain::InvalidFileNameError&) {
        invalid = true;
    }
    assert(invalid);
    std::cout << "[PASS] Download permissions." << std::endl;
}

void TestFinishedJobsAreForgotten() {
    std::cout << "[Test] Finished jobs beyond the retention limit are forgotten..." << std::endl;
    Harness h("retention", 1, 2);
    app::RegisterDemoTypes(*h.service, 50);
    assert(h.orchestrator->start());

    std::vector<domain::ExportNotification> runs;
    for (int i = 0; i < 5; ++i) {
        runs.push_back(h.service->runExport(FullUser(), ProductRequest()));
        assert(h.orchestrator->waitIdle(std::chrono::duration_cast<std::chrono::milliseconds>(kWait)));
    }

    assert(h.hub->size() == 2);
    for (int i = 0; i < 3; ++i) {
        assert(!h.orchestrator->status(runs[i].jobId));
        assert(!h.hub->find(runs[i].id));
        assert(!h.hub->findByJobId(runs[i].jobId));
        assert(h.hub->history(runs[i].id).empty());
    }
    for (int i = 3; i < 5; ++i) {
        assert(h.orchestrator->status(runs[i].jobId) == ExportJobStatus::Completed);
        auto latest = h.hub->findByJobId(runs[i].jobId);
        assert(latest && latest->status == ExportJobStatus::Completed);
    }
    assert(h.publishedFiles() == 5);
    std::cout << "[PASS] Retention limit." << std::endl;
}

void TestHubSubscriptions() {
    std::cout << "[Test] Subscribers receive updates until they unsubscribe..." << std::endl;
    infrastructure::InMemoryPushNotificationHub hub(1);

    std::vector<ExportJobStatus> seen;
    int subscription = hub.subscribe([&seen](const domain::ExportNotification& n) { seen.push_back(n.status); });
    int failing = hub.subscribe([](const domain::ExportNotification&) { throw std::runtime_error("consumer down"); });

    domain::ExportNotification n;
    n.id = "n1";
    n.jobId = "j1";
    hub.send(n);
    n.status = ExportJobStatus::Running;
    hub.send(n);

    hub.unsubscribe(subscription);
    hub.unsubscribe(failing);
    hub.unsubscribe(999);
    n.status = ExportJobStatus::Completed;
    hub.send(n);

    assert(seen.size() == 2);
    assert(seen.back() == ExportJobStatus::Running);
    assert(hub.history("n1").size() == 3);

    // A repeated terminal update does not count twice against the limit.
    hub.send(n);
    assert(hub.findByJobId("j1"));

    domain::ExportNotification other;
    other.id = "n2";
    other.jobId = "j2";
    other.status = ExportJobStatus::Failed;
    hub.send(other);
    assert(hub.size() == 1);
    assert(!hub.find("n1"));
    assert(!hub.findByJobId("j1"));
    assert(hub.findByJobId("j2")->status == ExportJobStatus::Failed);
    std::cout << "[PASS] Hub subscriptions." << std::endl;
}

void TestNonStandardThrowFailsJob() {
    std::cout << "[Test] A job body throwing a non-exception value still fails cleanly..." << std::endl;
    auto hub = std::make_shared<infrastructure::InMemoryPushNotificationHub>();
    application::ExportJobOrchestrator orchestrator(
        hub,
        [](const domain::ExportDataRequest&, const std::string&,
           const application::ExportProgressCallback&, const application::CancellationToken&) -> application::ExportResult {
            throw 42;
        });
    assert(orchestrator.start());

    domain::ExportNotification notification;
    notification.id = "odd";
    auto jobId = orchestrator.enqueue(ProductRequest(), notification);
    assert(orchestrator.waitIdle(std::chrono::duration_cast<std::chrono::milliseconds>(kWait)));

    assert(orchestrator.status(jobId) == ExportJobStatus::Failed);
    auto latest = hub->findByJobId(jobId);
    assert(latest && latest->status == ExportJobStatus::Failed);
    assert(latest->errors.size() == 1 && latest->errors.front() == "Unknown error");
    assert(latest->finished.has_value());

    // The worker survived and keeps serving jobs.
    notification.id = "odd2";
    auto second = orchestrator.enqueue(ProductRequest(), notification);
    assert(orchestrator.waitIdle(std::chrono::duration_cast<std::chrono::milliseconds>(kWait)));
    assert(orchestrator.status(second) == ExportJobStatus::Failed);
    orchestrator.stop();
    std::cout << "[PASS] Non-standard throw." << std::endl;
}

void TestEnqueueAfterStopIsCancelled() {
    std::cout << "[Test] Jobs submitted after stop are cancelled immediately..." << std::endl;
    auto hub = std::make_shared<infrastructure::InMemoryPushNotificationHub>();
    std::atomic<int> bodyCalls{0};
    application::ExportJobOrchestrator orchestrator(
        hub,
        [&bodyCalls](const domain::ExportDataRequest&, const std::string&,
                     const application::ExportProgressCallback&, const application::CancellationToken&) {
            ++bodyCalls;
            return application::ExportResult{};
        });
    assert(orchestrator.start());
    orchestrator.stop();

    domain::ExportNotification notification;
    notification.id = "late";
    auto jobId = orchestrator.enqueue(ProductRequest(), notification);

    assert(orchestrator.queueSize() == 0);
    assert(orchestrator.status(jobId) == ExportJobStatus::Cancelled);
    auto history = hub->history("late");
    assert(history.size() == 2);
    assert(history.front().status == ExportJobStatus::Queued);
    assert(history.back().status == ExportJobStatus::Cancelled);
    assert(history.back().finished.has_value());
    assert(orchestrator.waitIdle(std::chrono::milliseconds(100)));
    assert(bodyCalls.load() == 0);
    std::cout << "[PASS] Enqueue after stop." << std::endl;
}

} // namespace

int main() {
    try {
        TestProductScenario();
        TestCsvProjectionRun();
        TestDenialHasNoSideEffects();
        TestUnknownTypeAndProvider();
        TestCancelBeforePickup();
        TestCancelWhileRunning();
        TestFailedJobPublishesNothing();
        TestConcurrentRunsEachTerminateOnce();
        TestDownloadPermissions();
        TestFinishedJobsAreForgotten();
        TestHubSubscriptions();
        TestNonStandardThrowFailsJob();
        TestEnqueueAfterStopIsCancelled();
    } catch (const std::exception& e) {
        std::cerr << "[FAIL] " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[PASS] All workflow tests." << std::endl;
    return 0;
}
