#include "store/JournalStore.hpp"

#include "RegistryTestHelper.hpp"

#include <doctest/doctest.h>

#include <csignal>
#include <filesystem>
#include <fstream>

#include <sys/resource.h>

using namespace DR;
using namespace DR::Testing;

namespace {

auto journalOptions(std::filesystem::path path) -> StorageOptions {
    StorageOptions options;
    options.journalPath        = std::move(path);
    options.compactAfterFrames = 0;
    return options;
}

auto appendGarbage(std::filesystem::path const& path, std::size_t count) -> void {
    std::ofstream out(path, std::ios::binary | std::ios::app);
    for (std::size_t i = 0; i < count; ++i)
        out.put(static_cast<char>(0x5A));
}

// Caps the size of files this process may write, so appends past `bytes` fail with EFBIG.
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        previousHandler = std::signal(SIGXFSZ, SIG_IGN);
        REQUIRE(::getrlimit(RLIMIT_FSIZE, &previous) == 0);
        rlimit limited = previous;
        limited.rlim_cur = bytes;
        REQUIRE(::setrlimit(RLIMIT_FSIZE, &limited) == 0);
    }
    ~FileSizeLimit() {
        ::setrlimit(RLIMIT_FSIZE, &previous);
        std::signal(SIGXFSZ, previousHandler);
    }

    FileSizeLimit(FileSizeLimit const&)            = delete;
    FileSizeLimit& operator=(FileSizeLimit const&) = delete;

private:
    rlimit previous{};
    void (*previousHandler)(int) = SIG_DFL;
};

} // namespace

TEST_SUITE("store.journal") {
    TEST_CASE("store must be opened before writing") {
        JournalStore store(journalOptions(tempPath("unopened.journal")));
        CHECK_FALSE(store.isOpen());
        auto write = store.insert("k", Bytes{1});
        REQUIRE_FALSE(write.has_value());
        CHECK(write.error().code == Error::Code::UnknownError);
        std::filesystem::remove_all(store.options().journalPath.parent_path());
    }

    TEST_CASE("empty journal path is a configuration error") {
        JournalStore store(StorageOptions{});
        auto         opened = store.open();
        REQUIRE_FALSE(opened.has_value());
        CHECK(opened.error().code == Error::Code::InvalidConfiguration);
    }

    TEST_CASE("reopen replays committed batches") {
        auto path = tempPath("replay.journal");
        {
            JournalStore store(journalOptions(path));
            REQUIRE(store.open().has_value());
            REQUIRE(store.insert("a", Bytes{1}).has_value());
            REQUIRE(store.insert("b", Bytes{2}).has_value());
            REQUIRE(store.remove("a").has_value());
            CHECK(store.sequence() == 3);
        }

        JournalStore reopened(journalOptions(path));
        REQUIRE(reopened.open().has_value());
        CHECK(reopened.sequence() == 3);
        CHECK(reopened.pendingFrames() == 3);
        CHECK(reopened.contains("a") == false);
        CHECK(reopened.get("b") == std::optional<Bytes>{Bytes{2}});

        REQUIRE(reopened.insert("c", Bytes{3}).has_value());
        CHECK(reopened.sequence() == 4);
        std::filesystem::remove_all(path.parent_path());
    }

    TEST_CASE("compaction keeps the content and shrinks the journal") {
        auto path = tempPath("compact.journal");
        {
            JournalStore store(journalOptions(path));
            REQUIRE(store.open().has_value());
            for (int i = 0; i < 20; ++i)
                REQUIRE(store.insert("key", Bytes(64, static_cast<std::uint8_t>(i))).has_value());
            auto before = std::filesystem::file_size(path);

            REQUIRE(store.compact().has_value());
            CHECK(store.pendingFrames() == 0);
            CHECK(std::filesystem::file_size(path) < before);

            REQUIRE(store.insert("other", Bytes{1}).has_value());
            CHECK(store.sequence() == 21);
        }

        JournalStore reopened(journalOptions(path));
        REQUIRE(reopened.open().has_value());
        CHECK(reopened.get("key") == std::optional<Bytes>{Bytes(64, 19)});
        CHECK(reopened.contains("other") == true);
        CHECK(reopened.pendingFrames() == 2);
        std::filesystem::remove_all(path.parent_path());
    }

    TEST_CASE("automatic compaction after the configured frame count") {
        auto path    = tempPath("auto.journal");
        auto options = journalOptions(path);
        options.compactAfterFrames = 4;

        JournalStore store(options);
        REQUIRE(store.open().has_value());
        for (int i = 0; i < 3; ++i)
            REQUIRE(store.insert("k" + std::to_string(i), Bytes{1}).has_value());
        CHECK(store.pendingFrames() == 3);
        REQUIRE(store.insert("k3", Bytes{1}).has_value());
        CHECK(store.pendingFrames() == 0);
        CHECK(store.size() == 4);
        std::filesystem::remove_all(path.parent_path());
    }

    TEST_CASE("torn tail is repaired on open") {
        auto path = tempPath("torn.journal");
        {
            JournalStore store(journalOptions(path));
            REQUIRE(store.open().has_value());
            REQUIRE(store.insert("kept", Bytes{1}).has_value());
        }
        auto intact = std::filesystem::file_size(path);
        appendGarbage(path, 3);

        JournalStore store(journalOptions(path));
        REQUIRE(store.open().has_value());
        CHECK(std::filesystem::file_size(path) == intact);
        CHECK(store.contains("kept") == true);
        REQUIRE(store.insert("after", Bytes{2}).has_value());

        JournalStore reopened(journalOptions(path));
        REQUIRE(reopened.open().has_value());
        CHECK(reopened.contains("after") == true);
        std::filesystem::remove_all(path.parent_path());
    }

    TEST_CASE("torn tail without repair fails to open") {
        auto path = tempPath("torn_strict.journal");
        {
            JournalStore store(journalOptions(path));
            REQUIRE(store.open().has_value());
            REQUIRE(store.insert("kept", Bytes{1}).has_value());
        }
        appendGarbage(path, 6);

        auto options           = journalOptions(path);
        options.repairTornTail = false;
        JournalStore store(options);
        auto         opened = store.open();
        REQUIRE_FALSE(opened.has_value());
        CHECK(opened.error().code == Error::Code::MalformedInput);
        CHECK_FALSE(store.isOpen());
        CHECK(store.size() == 0);
        std::filesystem::remove_all(path.parent_path());
    }

    TEST_CASE("header write failure fails open") {
        if (!std::filesystem::exists("/dev/full"))
            return;
        JournalStore store(journalOptions("/dev/full"));
        auto         opened = store.open();
        REQUIRE_FALSE(opened.has_value());
        CHECK(opened.error().code == Error::Code::UnknownError);
        CHECK_FALSE(store.isOpen());
    }

    TEST_CASE("failed write blocks the store until reopened") {
        auto         path = tempPath("failed_write.journal");
        JournalStore store(journalOptions(path));
        REQUIRE(store.open().has_value());
        REQUIRE(store.insert("kept", Bytes{1}).has_value());
        auto const committed = std::filesystem::file_size(path);

        {
            FileSizeLimit limit(static_cast<rlim_t>(committed));
            auto          failed = store.insert("lost", Bytes(256, 7));
            REQUIRE_FALSE(failed.has_value());
            CHECK(failed.error().code == Error::Code::UnknownError);
        }

        auto refused = store.insert("other", Bytes{2});
        REQUIRE_FALSE(refused.has_value());
        CHECK(refused.error().code == Error::Code::UnknownError);

        REQUIRE(store.open().has_value());
        CHECK(std::filesystem::file_size(path) == committed);
        CHECK(store.contains("kept") == true);
        CHECK(store.contains("lost") == false);
        CHECK(store.sequence() == 1);
        REQUIRE(store.insert("after", Bytes{3}).has_value());

        JournalStore reopened(journalOptions(path));
        REQUIRE(reopened.open().has_value());
        CHECK(reopened.sequence() == 2);
        CHECK(reopened.contains("after") == true);
        CHECK(reopened.contains("lost") == false);
        std::filesystem::remove_all(path.parent_path());
    }

    TEST_CASE("foreign files are not journals") {
        auto path = tempPath("foreign.journal");
        appendGarbage(path, 32);
        JournalStore store(journalOptions(path));
        auto         opened = store.open();
        REQUIRE_FALSE(opened.has_value());
        CHECK(opened.error().code == Error::Code::MalformedInput);
        std::filesystem::remove_all(path.parent_path());
    }
}

TEST_SUITE("registry.persistence") {
    TEST_CASE("registry state survives a restart") {
        auto path = tempPath("registry.journal");
        {
            JournalStore store(journalOptions(path));
            REQUIRE(store.open().has_value());
            auto registry = Registry::create(store, at(admin(), T0));
            REQUIRE(registry.has_value());
            auto& reg = **registry;
            REQUIRE(reg.reserve(at(admin(), T0), ReservePayload{.name = "held", .extension = "icp", .wallet = bob()}).has_value());
            REQUIRE(reg.claim(at(alice(), T0), ClaimPayload{.name = "alice", .extension = "icp", .duration = OneHour}).has_value());
            REQUIRE(reg.transfer(at(alice(), T0 + 1), "alice.icp", carol()).has_value());
        }

        JournalStore store(journalOptions(path));
        REQUIRE(store.open().has_value());
        auto again = Registry::create(store, at(bob(), T0));
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code == Error::Code::AlreadyInitialized);

        auto registry = Registry::open(store);
        REQUIRE(registry.has_value());
        auto& reg = **registry;
        CHECK(reg.getCanisterOwner() == admin());
        CHECK(reg.lookup("alice.icp") == carol());
        CHECK(reg.getReservation("held.icp") == bob());

        auto history = reg.getDomainHistory("alice.icp");
        REQUIRE(history.has_value());
        CHECK(history->size() == 2);
        std::filesystem::remove_all(path.parent_path());
    }
}
