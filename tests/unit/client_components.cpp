#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fake_disk.hpp"
#include "yadrive/archive.hpp"
#include "yadrive/client/backoff.hpp"
#include "yadrive/client/catalogue.hpp"
#include "yadrive/client/config.hpp"
#include "yadrive/client/disk_api.hpp"
#include "yadrive/client/lifecycle.hpp"
#include "yadrive/client/logger.hpp"
#include "yadrive/client/path_resolver.hpp"
#include "yadrive/client/progress.hpp"
#include "yadrive/client/reports.hpp"
#include "yadrive/client/transfer_engine.hpp"
#include "yadrive/crypto.hpp"

using namespace yadrive;
using namespace yadrive::client;
using yadrive::testing::FakeDisk;

namespace
{

    std::filesystem::path make_temp_dir(const std::string &name)
    {
        const auto dir = std::filesystem::temp_directory_path() / ("yadrive_client_" + name);
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        return dir;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    nlohmann::json read_json(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        return nlohmann::json::parse(in);
    }

    // Wires every client component against one FakeDisk and a scratch directory.
    struct Harness
    {
        explicit Harness(const std::string &name)
            : root(make_temp_dir(name)),
              logger(std::nullopt),
              api(disk, FakeDisk::kEndpoint, FakeDisk::kAuthorization, logger, 4),
              resolver(api, logger, root / "work"),
              walker(api, logger, BackoffPolicy{.max_attempts = 3}, recorder(), 2),
              lifecycle(api, resolver, walker, logger, BackoffPolicy{.max_attempts = 5}, recorder()),
              transfers(api, resolver, logger, root / "downloads", 2),
              reports(logger, root / "reports", root / "downloads")
        {
            std::filesystem::create_directories(root / "work");
        }

        ~Harness()
        {
            std::error_code ec;
            std::filesystem::remove_all(root, ec);
        }

        Sleeper recorder()
        {
            return [this](std::chrono::milliseconds delay)
            { sleeps.push_back(delay); };
        }

        const Catalogue &reload()
        {
            auto snapshot = lifecycle.reload();
            if (!snapshot)
            {
                throw std::runtime_error("reload failed: " + describe(snapshot.error()));
            }
            return *lifecycle.snapshot();
        }

        std::filesystem::path root;
        FakeDisk disk;
        std::vector<std::chrono::milliseconds> sleeps;
        Logger logger;
        DiskApi api;
        PathResolver resolver;
        CatalogueWalker walker;
        LifecycleManager lifecycle;
        TransferEngine transfers;
        Reports reports;
    };

    void test_backoff_policy()
    {
        BackoffPolicy policy{};
        assert(policy.delay_for(0) == std::chrono::milliseconds(100));
        assert(policy.delay_for(1) == std::chrono::milliseconds(200));
        assert(policy.delay_for(3) == std::chrono::milliseconds(800));
        assert(policy.delay_for(10) == std::chrono::milliseconds(5000));

        BackoffPolicy small{.max_attempts = 3, .initial_delay = std::chrono::milliseconds(10)};
        assert(small.total_budget() == std::chrono::milliseconds(30));
        BackoffPolicy single{.max_attempts = 1};
        assert(single.total_budget() == std::chrono::milliseconds(0));
    }

    void test_progress_tracker()
    {
        std::vector<ProgressUpdate> updates;
        ProgressTracker tracker("file.bin", 10, [&](const ProgressUpdate &update)
                                { updates.push_back(update); });
        std::string received;
        auto sink = tracker.wrap([&](const char *data, std::size_t size)
                                 {
                                     received.append(data, size);
                                     return received.size() <= 6;
                                 });
        const bool accepted = sink("abcd", 4);
        const bool rejected = !sink("efgh", 4);
        assert(accepted);
        assert(rejected);
        // the rejected chunk is not counted
        assert(tracker.transferred() == 4);

        auto upload = tracker.upload_callback();
        upload(6);
        tracker.finish();
        assert(tracker.transferred() == 10);
        assert(updates.back().finished);
        assert(updates.back().total == 10);
        assert(updates.back().label == "file.bin");
    }

    void test_config_parsing()
    {
        ::unsetenv("YADRIVE_TOKEN");
        {
            char program[] = "yadrive_client";
            char token_flag[] = "--token";
            char token[] = "abc";
            char page_flag[] = "--page-size";
            char page[] = "25";
            char *argv[] = {program, token_flag, token, page_flag, page};
            const auto config = parse_arguments(5, argv);
            assert(config.token == "abc");
            assert(config.page_size == 25);
            assert(config.endpoint == "https://cloud-api.yandex.net/v1/disk/resources");
            assert(config.auth_scheme == "OAuth");
            assert(config.download_root == std::filesystem::path("downloads"));
            assert(config.poll_attempts == 20);
            assert(config.chunk_size == 64 * 1024);
        }
        {
            char program[] = "yadrive_client";
            char *argv[] = {program};
            bool threw = false;
            try
            {
                (void)parse_arguments(1, argv);
            }
            catch (const std::runtime_error &)
            {
                threw = true;
            }
            assert(threw);
        }
        {
            ::setenv("YADRIVE_TOKEN", "from-env", 1);
            char program[] = "yadrive_client";
            char flag[] = "--page-size";
            char value[] = "zero";
            char *argv[] = {program, flag, value};
            bool threw = false;
            try
            {
                (void)parse_arguments(3, argv);
            }
            catch (const std::exception &)
            {
                threw = true;
            }
            assert(threw);

            char *plain[] = {program};
            assert(parse_arguments(1, plain).token == "from-env");
            ::unsetenv("YADRIVE_TOKEN");
        }
    }

    void test_walk_aggregates_sizes()
    {
        Harness h("walk");
        h.disk.add_file("a/b/c/deep.txt", std::string(10, 'd'));
        h.disk.add_file("a/b/mid.txt", std::string(20, 'm'));
        h.disk.add_file("a/top.txt", std::string(5, 't'));
        h.disk.add_file("root.txt", std::string(7, 'r'));
        h.disk.add_folder("e");

        std::size_t beats = 0;
        h.walker.set_heartbeat([&beats]
                               { ++beats; });
        const auto &catalogue = h.reload();

        assert(catalogue.all_files.size() == 4);
        assert(catalogue.all_folders.size() == 4);
        assert(catalogue.total_size == 42);
        // root holds three children and pages hold two
        assert(beats > catalogue.all_folders.size() + 1);

        for (const auto &folder : catalogue.all_folders)
        {
            std::uint64_t expected = 0;
            for (const auto &file : catalogue.all_files)
            {
                if (file.path.rfind(folder.path + "/", 0) == 0)
                {
                    expected += file.size;
                }
            }
            assert(folder.size == expected);
        }

        const auto a = catalogue.find_by_path("/a");
        assert(a && resource::entry_size(*a) == 35);
        const auto deep = catalogue.find_by_path("disk:/a/b/c");
        assert(deep && resource::entry_size(*deep) == 10);
        const auto by_name = catalogue.find_by_name("mid.txt");
        assert(by_name && resource::entry_path(*by_name) == "disk:/a/b/mid.txt");
    }

    void test_walk_retries_transient_failures()
    {
        Harness h("retry");
        h.disk.add_file("x.txt", "xx");
        h.disk.fail_next_metadata(2, 503);
        const auto &catalogue = h.reload();
        assert(catalogue.all_files.size() == 1);
        assert(h.sleeps.size() == 2);
        assert(h.sleeps[0] == std::chrono::milliseconds(100));
        assert(h.sleeps[1] == std::chrono::milliseconds(200));

        h.disk.fail_next_metadata(3, 500);
        auto failed = h.lifecycle.reload();
        assert(!failed);
        assert(failed.error().kind == ErrorCode::TransferFailure);
        assert(failed.error().status == 500);
        // the previous snapshot survives a failed reload
        assert(h.lifecycle.snapshot()->all_files.size() == 1);

        h.disk.fail_next_metadata(1, 403);
        auto forbidden = h.lifecycle.reload();
        assert(!forbidden);
        assert(forbidden.error().status == 403);

        auto missing = h.walker.build("disk:/nowhere");
        assert(!missing);
        assert(missing.error().kind == ErrorCode::NotFound);
    }

    void test_authorization_header()
    {
        Harness h("auth");
        DiskApi anonymous(h.disk, FakeDisk::kEndpoint, "OAuth wrong", h.logger);
        auto state = anonymous.probe("disk:/");
        assert(!state);
        assert(state.error().status == 401);
        assert(state.error().message == "Unauthorized");

        auto root = h.api.probe("disk:/");
        assert(root && root.value() == ExistenceState::Exists);
        auto absent = h.api.probe("disk:/absent");
        assert(absent && absent.value() == ExistenceState::NotFound);
    }

    void test_create_folder_idempotent()
    {
        Harness h("mkdir");
        auto first = h.lifecycle.create_folder("docs", std::string("docs"));
        assert(first && first.value().creation == FolderCreation::Created);
        auto second = h.lifecycle.create_folder("docs", std::string("docs"));
        assert(second && second.value().creation == FolderCreation::AlreadyExists);

        const auto &folders = h.lifecycle.snapshot()->all_folders;
        assert(std::count_if(folders.begin(), folders.end(),
                             [](const resource::Folder &folder)
                             { return folder.path == "disk:/docs"; }) == 1);

        LifecycleManager picking(h.api, h.resolver, h.walker, h.logger, BackoffPolicy{}, h.recorder(),
                                 Decisions{.pick_parent_folder = [](const Catalogue &catalogue)
                                           {
                                               assert(!catalogue.all_folders.empty());
                                               return std::optional<std::string>(catalogue.all_folders.front().path);
                                           }});
        const auto picked = picking.reload();
        assert(picked);
        auto nested = picking.create_folder("sub");
        assert(nested && nested.value().remote_path == "disk:/docs/sub");
        assert(h.disk.exists("docs/sub"));

        LifecycleManager root_default(h.api, h.resolver, h.walker, h.logger, BackoffPolicy{}, h.recorder());
        auto top = root_default.create_folder("top");
        assert(top && top.value().remote_path == "top");
        assert(h.disk.exists("top"));

        auto orphan = h.lifecycle.create_folder("r", std::string("q/r"));
        assert(!orphan);
        assert(orphan.error().kind == ErrorCode::TransferFailure);
        assert(orphan.error().status == 409);
    }

    void test_ensure_folder_creates_ancestors()
    {
        Harness h("ensure");
        auto created = h.resolver.ensure_folder("x/y/z");
        assert(created && created.value() == FolderCreation::Created);
        assert(h.disk.exists("x"));
        assert(h.disk.exists("x/y"));
        assert(h.disk.exists("x/y/z"));

        auto again = h.resolver.ensure_folder("disk:/x/y/z");
        assert(again && again.value() == FolderCreation::AlreadyExists);

        auto root = h.resolver.ensure_folder("disk:/");
        assert(root && root.value() == FolderCreation::AlreadyExists);
    }

    void test_upload_download_roundtrip()
    {
        Harness h("roundtrip");
        std::string content;
        for (int i = 0; i < 1000; ++i)
        {
            content.push_back(static_cast<char>(i % 251));
        }
        write_file(h.root / "work" / "sub" / "data.bin", content);

        std::vector<ProgressUpdate> updates;
        h.transfers.set_progress_callback([&](const ProgressUpdate &update)
                                          { updates.push_back(update); });

        const auto &before = h.reload();
        auto uploaded = h.transfers.upload(std::filesystem::path("sub/data.bin"), before);
        assert(uploaded);
        assert(uploaded.value().count(UploadOutcome::Uploaded) == 1);
        assert(uploaded.value().failures.empty());
        assert(uploaded.value().items[0].remote_path == "sub/data.bin");
        assert(uploaded.value().items[0].bytes == content.size());
        assert(h.disk.content("sub/data.bin") == std::optional<std::string>(content));
        assert(!updates.empty());
        assert(updates.back().finished);
        assert(updates.back().transferred == content.size());
        assert(updates.back().total == content.size());

        const auto &after = h.reload();
        const auto entry = after.find_by_path("sub/data.bin");
        assert(entry);
        updates.clear();
        auto downloaded = h.transfers.download(*entry);
        assert(downloaded);
        const auto local = h.root / "downloads" / "sub" / "data.bin";
        assert(downloaded.value().local_path == local);
        assert(read_file(local) == content);
        assert(crypto::hash_file(local) == std::get<resource::File>(*entry).sha256);
        assert(!std::filesystem::exists(h.root / "downloads" / "sub" / "data.bin.part"));
        assert(updates.back().transferred == content.size());
        // 4-byte chunks
        assert(updates.size() > content.size() / 4);
    }

    void test_upload_collision_is_skipped()
    {
        Harness h("collision");
        h.disk.add_file("notes.txt", "remote");
        write_file(h.root / "work" / "notes.txt", "local");

        auto report = h.transfers.upload(std::filesystem::path("notes.txt"), h.reload());
        assert(report);
        assert(report.value().failures.empty());
        assert(report.value().count(UploadOutcome::AlreadyPresent) == 1);
        assert(h.disk.content("notes.txt") == std::optional<std::string>("remote"));
        assert(h.disk.count(http::Method::Put, "/upload/0") == 0);
    }

    void test_directory_upload_is_flat()
    {
        Harness h("flat");
        write_file(h.root / "work" / "album" / "1.jpg", "one");
        write_file(h.root / "work" / "album" / "2.jpg", "two");
        write_file(h.root / "work" / "album" / "3.jpg", "three");
        write_file(h.root / "work" / "album" / "inner" / "4.jpg", "four");
        h.disk.fail_upload_of("album/2.jpg", 507);

        auto report = h.transfers.upload(std::filesystem::path("album"), h.reload());
        assert(report);
        assert(report.value().remote_folder == "album");
        assert(report.value().count(UploadOutcome::Uploaded) == 2);
        assert(report.value().failures.size() == 1);
        assert(report.value().failures[0].first == "album/2.jpg");
        assert(report.value().failures[0].second.status == 507);
        assert(h.disk.exists("album/1.jpg"));
        assert(h.disk.exists("album/3.jpg"));
        assert(!h.disk.exists("album/inner"));
        assert(!h.disk.exists("album/inner/4.jpg"));
    }

    void test_archive_name_matching()
    {
        Harness h("zipmatch");
        h.disk.add_file("other/site.txt", "s");
        h.disk.add_folder("projects/site");
        h.disk.add_folder("projects/blog");
        write_file(h.root / "work" / "site.zip", "zip-bytes");
        write_file(h.root / "work" / "nested" / "blog.zip", "blog-bytes");
        write_file(h.root / "work" / "nested" / "misc.zip", "misc-bytes");

        const auto &catalogue = h.reload();
        auto site = h.resolver.locate("site.zip");
        assert(site);
        auto target = h.resolver.resolve_upload_target(site.value(), catalogue);
        assert(target && target.value().matched_by_name);
        // files are searched before folders
        assert(target.value().remote_path == "disk:/other/site.zip");

        auto blog = h.transfers.upload(std::filesystem::path("blog.zip"), catalogue);
        assert(blog && blog.value().count(UploadOutcome::Uploaded) == 1);
        assert(h.disk.exists("projects/blog.zip"));

        auto misc = h.transfers.upload(std::filesystem::path("misc.zip"), catalogue);
        assert(misc && misc.value().count(UploadOutcome::Uploaded) == 1);
        assert(h.disk.exists("nested/misc.zip"));

        auto directory = h.resolver.locate("nested");
        assert(directory && directory.value().is_directory);
        auto rejected = h.resolver.resolve_upload_target(directory.value(), catalogue);
        assert(!rejected && rejected.error().kind == ErrorCode::InvalidArgument);
    }

    void test_url_import()
    {
        Harness h("import");
        assert(photo_file_name(PhotoRef{.url = "u", .likes = 5, .timestamp = 1577836800}) == "5_2020-01-01.jpg");
        assert(photo_file_name(PhotoRef{.url = "u", .likes = 12, .timestamp = 1600000000}) == "12_2020-09-13.jpg");

        const auto photos = nlohmann::json::parse(R"([
            {"url": "https://images.example/1.jpg", "likes": 5, "date": 1577836800},
            {"url": "https://images.example/2.jpg", "likes": 12, "date": 1600000000}
        ])")
                                .get<std::vector<PhotoRef>>();
        UrlImport request{.photos = photos, .album = "cats"};
        auto report = h.transfers.upload(request, h.reload());
        assert(report);
        assert(report.value().remote_folder == "photos/cats");
        assert(report.value().count(UploadOutcome::Uploaded) == 2);
        assert(h.disk.exists("photos/cats/5_2020-01-01.jpg"));
        assert(h.disk.exists("photos/cats/12_2020-09-13.jpg"));
        assert(h.disk.imported_urls().size() == 2);
        assert(h.disk.imported_urls()[0] == "https://images.example/1.jpg");

        // same names again: the remote refuses, the batch reports and continues
        auto repeat = h.transfers.import_urls(request);
        assert(repeat);
        assert(repeat.value().failures.size() == 2);
        assert(repeat.value().failures[0].second.status == 409);
    }

    void test_not_found_locally()
    {
        Harness h("ghost");
        auto report = h.transfers.upload(std::filesystem::path("ghost.txt"), h.reload());
        assert(!report);
        assert(report.error().kind == ErrorCode::NotFoundLocally);
    }

    void test_top10_and_biggest()
    {
        Harness h("reports");
        Catalogue catalogue;
        const std::vector<std::uint64_t> sizes{5, 90, 40, 90, 10, 70, 40, 20, 60, 30, 80, 1};
        for (std::size_t i = 0; i < sizes.size(); ++i)
        {
            const auto name = "f" + std::to_string(i);
            catalogue.all_files.push_back(resource::File{.path = "disk:/" + name, .name = name, .size = sizes[i]});
        }

        const auto top = top10(catalogue, resource::ResourceType::File);
        assert(top.size() == 10);
        for (std::size_t i = 1; i < top.size(); ++i)
        {
            assert(resource::entry_size(top[i - 1]) >= resource::entry_size(top[i]));
        }
        assert(resource::entry_name(top[0]) == "f1");
        assert(resource::entry_name(top[1]) == "f3");
        assert(resource::entry_name(top[5]) == "f2");
        assert(resource::entry_name(top[6]) == "f6");
        assert(top10(catalogue, resource::ResourceType::Dir).empty());

        auto biggest = h.reports.find_biggest(catalogue, resource::ResourceType::File);
        assert(biggest && resource::entry_name(biggest.value()) == "f1");
        const auto json = read_json(h.root / "reports" / "biggest_file_info.json");
        assert(json == nlohmann::json({{"f1", 90}}));

        auto none = h.reports.find_biggest(catalogue, resource::ResourceType::Dir);
        assert(!none && none.error().kind == ErrorCode::NotFound);

        assert(format_size(0) == "0 KB");
        assert(format_size(512 * 1024) == "512 KB");
        assert(format_size(1536 * 1024) == "1.50 MB");
        assert(format_size(std::uint64_t{99999} * 1024) == "97.66 MB");
        assert(format_size(std::uint64_t{100000} * 1024) == "100000 KB");
        assert(format_size(std::uint64_t{100001} * 1024) == "0.10 GB");
        assert(format_size(std::uint64_t{3} * 1024 * 1024 * 1024) == "3.00 GB");
    }

    void test_delete_waits_for_removal()
    {
        Harness h("delete");
        h.disk.add_file("old.txt", "old");
        h.disk.add_file("keep.txt", "keep");
        h.disk.set_delete_lag(3);
        const auto entry = h.reload().find_by_name("old.txt");
        assert(entry);

        h.sleeps.clear();
        auto removed = h.lifecycle.remove({*entry}, false);
        assert(removed);
        assert(removed.value() == "Moved to trash: old.txt");
        assert(h.sleeps.size() == 3);
        assert(h.disk.trashed() == std::vector<std::string>{"old.txt"});
        auto state = h.api.probe("disk:/old.txt");
        assert(state && state.value() == ExistenceState::NotFound);
        assert(!h.lifecycle.snapshot()->find_by_name("old.txt"));
        assert(h.lifecycle.snapshot()->find_by_name("keep.txt"));

        LifecycleManager asking(h.api, h.resolver, h.walker, h.logger, BackoffPolicy{}, h.recorder(),
                                Decisions{.delete_permanently = [](const std::vector<resource::RemoteEntry> &entries)
                                          { return entries.size() == 1; }});
        h.disk.set_delete_lag(0);
        auto keep = asking.reload().value()->find_by_name("keep.txt");
        auto purged = asking.remove({*keep});
        assert(purged && purged.value() == "Permanently deleted: keep.txt");
        assert(h.disk.permanently_deleted() == std::vector<std::string>{"keep.txt"});
    }

    void test_delete_poll_times_out()
    {
        Harness h("timeout");
        h.disk.add_file("sticky.txt", "s");
        h.disk.set_delete_lag(50);
        const auto entry = h.reload().find_by_name("sticky.txt");
        h.sleeps.clear();
        auto removed = h.lifecycle.remove({*entry}, true);
        assert(!removed);
        assert(removed.error().kind == ErrorCode::Timeout);
        assert(removed.error().message == "disk:/sticky.txt still exists after 5 checks over 1500 ms");
        // five probes, sleeping between them only
        assert(h.sleeps.size() == 4);
        // the delete went through, so the snapshot was rebuilt anyway
        assert(!h.lifecycle.snapshot()->find_by_name("sticky.txt"));
    }

    void test_delete_batch_aborts_on_failure()
    {
        Harness h("batch");
        h.disk.add_file("a.txt", "a");
        h.disk.add_file("b.txt", "b");
        h.disk.add_file("c.txt", "c");
        h.disk.fail_delete_of("b.txt", 423);
        const auto &catalogue = h.reload();
        std::vector<resource::RemoteEntry> entries{*catalogue.find_by_name("a.txt"), *catalogue.find_by_name("b.txt"),
                                                   *catalogue.find_by_name("c.txt")};

        auto removed = h.lifecycle.remove(entries, true);
        assert(!removed);
        assert(removed.error().kind == ErrorCode::TransferFailure);
        assert(removed.error().status == 423);
        assert(removed.error().message == "Deletion refused.");
        assert(!h.disk.exists("a.txt"));
        assert(h.disk.exists("b.txt"));
        assert(h.disk.exists("c.txt"));
        const auto &after = *h.lifecycle.snapshot();
        assert(!after.find_by_name("a.txt"));
        assert(after.find_by_name("b.txt"));
        assert(after.find_by_name("c.txt"));

        // nothing deleted yet: no reload is issued
        h.disk.fail_delete_of("c.txt", 423);
        const auto listings = h.disk.metadata_queries();
        auto refused = h.lifecycle.remove({*after.find_by_name("c.txt")}, true);
        assert(!refused);
        assert(h.disk.metadata_queries() == listings);
    }

    void test_unknown_resource_type_is_invalid_response()
    {
        Harness h("foreign");
        h.disk.add_file("plain.txt", "p");
        h.disk.add_foreign("odd/link", "symlink");

        auto walked = h.walker.build("/");
        assert(!walked);
        assert(walked.error().kind == ErrorCode::InvalidResponse);
        auto reloaded = h.lifecycle.reload();
        assert(!reloaded);
        assert(reloaded.error().kind == ErrorCode::InvalidResponse);

        resource::Folder odd;
        odd.path = "disk:/odd";
        odd.name = "odd";
        auto downloaded = h.transfers.download(odd);
        assert(!downloaded);
        assert(downloaded.error().kind == ErrorCode::InvalidResponse);
    }

    void test_failed_upload_reload_decision()
    {
        Harness h("partial");
        write_file(h.root / "work" / "deep" / "inner" / "f.txt", "fff");
        h.disk.fail_create_of("deep/inner", 507);

        auto failed = h.transfers.upload(std::filesystem::path("deep/inner/f.txt"), h.reload());
        assert(!failed);
        assert(failed.error().status == 507);
        // the first ancestor was created before the failure
        assert(h.disk.exists("deep"));
        assert(upload_may_have_changed_remote(failed.error()));
        assert(h.reload().find_by_path("deep"));

        auto missing = h.transfers.upload(std::filesystem::path("absent.txt"), h.reload());
        assert(!missing);
        assert(!upload_may_have_changed_remote(missing.error()));
    }

    void test_download_folder_and_checksum()
    {
        Harness h("download");
        h.disk.add_file("docs/x.txt", "xxxx");
        h.disk.add_file("docs/inner/y.txt", "yyyyyyyy");
        h.disk.add_file("docs/inner/z.txt", "z");
        h.disk.add_file("bad.txt", "bad");
        h.disk.corrupt_sha256_of("bad.txt");
        const auto &catalogue = h.reload();

        auto first = h.transfers.download(*catalogue.find_by_path("docs"));
        assert(first);
        assert(first.value().files == 3);
        assert(first.value().folders == 2);
        assert(first.value().existing_directories.empty());
        assert(read_file(h.root / "downloads" / "docs" / "inner" / "y.txt") == "yyyyyyyy");

        auto second = h.transfers.download(*catalogue.find_by_path("docs"));
        assert(second);
        assert(second.value().existing_directories.size() == 2);

        auto corrupt = h.transfers.download(*catalogue.find_by_name("bad.txt"));
        assert(!corrupt);
        assert(corrupt.error().kind == ErrorCode::InvalidResponse);
        assert(!std::filesystem::exists(h.root / "downloads" / "bad.txt"));
        assert(!std::filesystem::exists(h.root / "downloads" / "bad.txt.part"));
    }

    void test_zip_sidecar()
    {
        Harness h("zip");
        h.disk.add_file("docs/x.txt", "xxxx");
        h.disk.add_file("docs/inner/y.txt", "yyyyyyyy");
        h.disk.add_file("solo.txt", "solo");
        const auto &catalogue = h.reload();
        const auto docs = *catalogue.find_by_path("docs");
        const auto solo = *catalogue.find_by_name("solo.txt");

        auto missing = h.reports.zip_entry(solo);
        assert(!missing && missing.error().kind == ErrorCode::NotFoundLocally);

        const auto docs_download = h.transfers.download(docs);
        const auto solo_download = h.transfers.download(solo);
        assert(docs_download);
        assert(solo_download);

        auto folder_zip = h.reports.zip_entry(docs);
        assert(folder_zip);
        assert(folder_zip.value().archive == h.root / "downloads" / "docs.zip");
        const auto folder_info = read_json(h.root / "downloads" / "docs.zip_info.json");
        assert(folder_info.at("file_name") == "docs");
        assert(folder_info.at("size") == resource::entry_size(docs));
        assert(folder_info.at("size") == 12);
        assert(folder_info.at("path") == resource::entry_path(docs));
        const auto folder_entries = archive::list_entries(folder_zip.value().archive);
        const auto has = [&](const std::string &name)
        {
            return std::any_of(folder_entries.begin(), folder_entries.end(),
                               [&](const archive::ArchiveEntry &entry)
                               { return entry.name == name; });
        };
        assert(has("docs/"));
        assert(has("docs/x.txt"));
        assert(has("docs/inner/y.txt"));

        auto file_zip = h.reports.zip_entry(solo);
        assert(file_zip);
        const auto file_entries = archive::list_entries(h.root / "downloads" / "solo.zip");
        assert(file_entries.size() == 1);
        assert(file_entries[0].name == "solo.txt");
        assert(file_entries[0].uncompressed_size == 4);
        const auto file_info = read_json(h.root / "downloads" / "solo.zip_info.json");
        assert(file_info.at("file_name") == "solo.txt");
        assert(file_info.at("size") == resource::entry_size(solo));
        assert(file_info.at("path") == "disk:/solo.txt");
    }

} // namespace

void run_client_component_tests()
{
    test_backoff_policy();
    test_progress_tracker();
    test_config_parsing();
    test_walk_aggregates_sizes();
    test_walk_retries_transient_failures();
    test_authorization_header();
    test_create_folder_idempotent();
    test_ensure_folder_creates_ancestors();
    test_upload_download_roundtrip();
    test_upload_collision_is_skipped();
    test_directory_upload_is_flat();
    test_archive_name_matching();
    test_url_import();
    test_not_found_locally();
    test_top10_and_biggest();
    test_delete_waits_for_removal();
    test_delete_poll_times_out();
    test_delete_batch_aborts_on_failure();
    test_unknown_resource_type_is_invalid_response();
    test_failed_upload_reload_decision();
    test_download_folder_and_checksum();
    test_zip_sidecar();
}
