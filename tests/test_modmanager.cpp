/**
 * @file test_modmanager.cpp
 * @brief End-to-end scenarios against a temporary game install
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "config.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include "modmanager.hpp"

#include "utils/TestHelpers.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

using namespace ModlayerTest;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

class ModManagerTest : public TempDirTest {
protected:
    GameInstall Install() const {
        return GameInstall { .game_id = "testgame", .root = game, .state_dir = state };
    }

    std::unique_ptr<ModManager> Open() {
        return std::make_unique<ModManager>(Install(), ApplyOptions { .retry = { .retries = 0, .delay_ms = 0 } });
    }

    void SetUpStockGame() {
        WriteGameFile("car/livery.dat", "stock livery");
        WriteGameFile("car/physics.dat", "stock physics");
        WriteGameFile("maps/track.map", "stock track");
    }

    static ErrorKind KindOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const ModException& ex) {
            return ex.kind;
        }
        ADD_FAILURE() << "expected a ModException";
        return ErrorKind::NotFound;
    }
};

// =============================================================================
// Round Trip Tests
// =============================================================================

TEST_F(ModManagerTest, ActivateThenRestoreIsByteIdentical) {
    SetUpStockGame();
    auto before = Snapshot(game);
    auto dirs_before = Directories(game);

    auto manager = Open();
    auto m1 = manager->RegisterMod(MakeModFolder("M1", { { "car/livery.dat", "m1 livery" } }));
    auto m2 = manager->RegisterMod(MakeModFolder("M2", {
        { "car/livery.dat", "m2 livery" },
        { "car/physics.dat", "m2 physics" },
        { "car/extras/spoiler.dat", "new file" }
    }));
    auto profile = manager->CreateProfile("Race");
    manager->ReorderProfile(profile, { m1, m2 });

    auto stats = manager->ActivateProfile(profile);
    EXPECT_EQ(3u, stats.written);
    EXPECT_EQ("m2 livery", ReadGameFile("car/livery.dat"));
    EXPECT_EQ("new file", ReadGameFile("car/extras/spoiler.dat"));
    EXPECT_EQ(profile, manager->ActiveProfile());
    EXPECT_EQ(3u, manager->BackupEntries().size());

    manager->RestoreVanilla();

    EXPECT_EQ(before, Snapshot(game));
    EXPECT_EQ(dirs_before, Directories(game));
    EXPECT_FALSE(manager->ActiveProfile().has_value());
    EXPECT_THAT(manager->OverlayEntries(), IsEmpty());
    EXPECT_THAT(manager->BackupEntries(), IsEmpty());
    EXPECT_FALSE(fs::exists(manager->JournalPath()));
}

TEST_F(ModManagerTest, SecondActivationWritesNothing) {
    SetUpStockGame();
    auto manager = Open();
    auto m = manager->RegisterMod(MakeModFolder("M", { { "car/livery.dat", "mod" } }));
    auto profile = manager->CreateProfile("P");
    manager->EnableMod(profile, m);

    EXPECT_EQ(1u, manager->ActivateProfile(profile).written);
    auto again = manager->ActivateProfile(profile);
    EXPECT_EQ(0u, again.written);
    EXPECT_EQ(0u, again.restored);
    EXPECT_EQ(1u, again.unchanged);
}

TEST_F(ModManagerTest, RestoreAfterRestoreRecapturesNewOriginals) {
    WriteGameFile("a.dat", "v1");
    auto manager = Open();
    auto m = manager->RegisterMod(MakeModFolder("M", { { "a.dat", "mod" } }));
    auto profile = manager->CreateProfile("P");
    manager->EnableMod(profile, m);

    manager->ActivateProfile(profile);
    manager->RestoreVanilla();

    // The game updated itself while vanilla
    WriteGameFile("a.dat", "v2");
    manager->ActivateProfile(profile);
    manager->DeactivateProfile();
    EXPECT_EQ("v2", ReadGameFile("a.dat"));
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST_F(ModManagerTest, DanglingReferenceFailsBeforeTouchingDisk) {
    SetUpStockGame();
    auto before = Snapshot(game);
    auto manager = Open();
    auto m = manager->RegisterMod(MakeModFolder("M", { { "car/livery.dat", "mod" } }));
    auto profile = manager->CreateProfile("P");
    manager->ReorderProfile(profile, { m, "missing-mod" });

    try {
        manager->ActivateProfile(profile);
        FAIL() << "expected DanglingModReference";
    } catch (const ModException& ex) {
        EXPECT_EQ(ErrorKind::DanglingModReference, ex.kind);
        EXPECT_THAT(ex.subjects, ElementsAre("missing-mod"));
    }

    EXPECT_EQ(before, Snapshot(game));
    EXPECT_FALSE(manager->ActiveProfile().has_value());
    EXPECT_THAT(manager->BackupEntries(), IsEmpty());
    EXPECT_FALSE(fs::exists(manager->JournalPath()));
}

TEST_F(ModManagerTest, InUseGuards) {
    SetUpStockGame();
    auto manager = Open();
    auto m = manager->RegisterMod(MakeModFolder("M", { { "car/livery.dat", "mod" } }));
    auto profile = manager->CreateProfile("P");
    manager->EnableMod(profile, m);
    manager->ActivateProfile(profile);

    EXPECT_EQ(ErrorKind::InUse, KindOf([&] { manager->RemoveMod(m); }));
    EXPECT_EQ(ErrorKind::InUse, KindOf([&] { manager->DeleteProfile(profile); }));

    manager->DeactivateProfile();
    manager->RemoveMod(m);
    manager->DeleteProfile(profile);
    EXPECT_THAT(manager->ListMods(), IsEmpty());
    EXPECT_THAT(manager->ListProfiles(), IsEmpty());
    EXPECT_EQ(ErrorKind::NotFound, KindOf([&] { manager->RemoveMod(m); }));
}

TEST_F(ModManagerTest, RejectsBadInstalls) {
    EXPECT_EQ(ErrorKind::NotFound, KindOf([&] {
        ModManager(GameInstall { .game_id = "g", .root = base / "nowhere", .state_dir = state });
    }));
    EXPECT_THROW(ModManager(GameInstall { .game_id = "g", .root = game, .state_dir = game / ".modlayer" }), std::invalid_argument);
}

TEST_F(ModManagerTest, MakeInstallUsesConfiguredStateRoot) {
    auto config = Config::GetInstance();
    config->state_root = (base / "states").string();

    auto install = ModManager::MakeInstall("My Game", game);
    EXPECT_EQ(base / "states" / "my_game", install.state_dir);
    EXPECT_EQ(base / "explicit", ModManager::MakeInstall("My Game", game, base / "explicit").state_dir);

    config->state_root = "";
}

// =============================================================================
// Queries
// =============================================================================

TEST_F(ModManagerTest, ListsModsAndConflicts) {
    auto manager = Open();
    auto m1 = manager->RegisterMod(MakeModFolder("M1", { { "car/livery.dat", "1" } }, R"({ "name": "M1", "author": "anna", "version": "1.0" })"));
    auto m2 = manager->RegisterMod(MakeModFolder("M2", { { "car/livery.dat", "2" }, { "car/physics.dat", "2" } }));
    auto profile = manager->CreateProfile("P");
    manager->ReorderProfile(profile, { m1, m2 });

    auto mods = manager->ListMods();
    ASSERT_EQ(2u, mods.size());
    EXPECT_EQ(m1, mods[0].id);
    EXPECT_EQ("anna", mods[0].author);
    EXPECT_EQ("1.0", mods[0].version);
    EXPECT_EQ(1u, mods[0].file_count);
    EXPECT_EQ(2u, mods[1].file_count);
    EXPECT_EQ(2u, manager->GetMod(m2).files.size());

    auto conflicts = manager->GetConflicts(profile);
    ASSERT_EQ(1u, conflicts.size());
    EXPECT_EQ("car/livery.dat", conflicts[0].path);
    EXPECT_EQ(m2, conflicts[0].winner);
    EXPECT_THAT(conflicts[0].losers, ElementsAre(m1));
}

TEST_F(ModManagerTest, VerifyFindsHandEdits) {
    SetUpStockGame();
    auto manager = Open();
    auto m = manager->RegisterMod(MakeModFolder("M", { { "car/livery.dat", "mod" }, { "car/physics.dat", "mod" } }));
    auto profile = manager->CreateProfile("P");
    manager->EnableMod(profile, m);
    manager->ActivateProfile(profile);

    EXPECT_THAT(manager->VerifyOverlay(), IsEmpty());
    WriteGameFile("car/physics.dat", "patched by the game launcher");
    EXPECT_THAT(manager->VerifyOverlay(), ElementsAre("car/physics.dat"));

    // Activation repairs nothing on its own: the entry still matches the winner
    EXPECT_EQ(0u, manager->ActivateProfile(profile).written);
}

TEST_F(ModManagerTest, ConcurrentReadersSeeConsistentState) {
    SetUpStockGame();
    auto manager = Open();
    auto m1 = manager->RegisterMod(MakeModFolder("M1", { { "car/livery.dat", "1" } }));
    auto m2 = manager->RegisterMod(MakeModFolder("M2", { { "car/livery.dat", "2" } }));
    auto profile = manager->CreateProfile("P");
    manager->ReorderProfile(profile, { m1, m2 });

    std::vector<std::thread> readers;
    std::atomic<int> bad_reads = 0;
    for (int i = 0; i < 4; i++) {
        readers.emplace_back([&] {
            for (int n = 0; n < 20; n++) {
                auto entries = manager->OverlayEntries();
                if (!entries.empty() && entries.size() != 1) bad_reads++;
                if (manager->GetConflicts(profile).size() != 1) bad_reads++;
            }
        });
    }
    for (int n = 0; n < 5; n++) {
        manager->ActivateProfile(profile);
        manager->DeactivateProfile();
    }
    for (auto& t : readers) {
        t.join();
    }
    EXPECT_EQ(0, bad_reads.load());
}

// =============================================================================
// Persistence And Recovery Tests
// =============================================================================

TEST_F(ModManagerTest, StateSurvivesReopen) {
    SetUpStockGame();
    auto before = Snapshot(game);
    std::string profile;
    {
        auto manager = Open();
        auto m = manager->RegisterMod(MakeModFolder("M", { { "car/livery.dat", "mod" }, { "new.dat", "added" } }));
        profile = manager->CreateProfile("Keep Me");
        manager->EnableMod(profile, m);
        manager->ActivateProfile(profile);
    }

    auto manifest = Manifest::Load(state / "manifest.json");
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(profile, manifest->active_profile);
    EXPECT_EQ(2u, manifest->overlay.size());

    auto reopened = Open();
    EXPECT_EQ(profile, reopened->ActiveProfile());
    EXPECT_EQ("Keep Me", reopened->GetProfile(profile).name);
    EXPECT_EQ(2u, reopened->OverlayEntries().size());
    EXPECT_EQ(0u, reopened->ActivateProfile(profile).written);

    reopened->DeactivateProfile();
    EXPECT_EQ(before, Snapshot(game));
}

TEST_F(ModManagerTest, InterruptedApplyIsRederivedFromDisk) {
    SetUpStockGame();
    auto before = Snapshot(game);
    std::string m;
    {
        auto manager = Open();
        m = manager->RegisterMod(MakeModFolder("M", { { "car/livery.dat", "mod" }, { "car/new.dat", "added" } }));
        auto profile = manager->CreateProfile("P");
        manager->EnableMod(profile, m);
        fs::copy_file(manager->ManifestPath(), base / "manifest-before.json");
        manager->ActivateProfile(profile);
    }

    // Simulate a crash after the writes but before the manifest update
    fs::copy_file(base / "manifest-before.json", state / "manifest.json", fs::copy_options::overwrite_existing);
    WriteFile(state / "apply.journal", "activate 0");

    auto manager = Open();
    EXPECT_FALSE(fs::exists(manager->JournalPath()));
    auto entries = manager->OverlayEntries();
    ASSERT_EQ(2u, entries.size());
    for (const auto& entry : entries) {
        EXPECT_EQ(m, entry.mod_id) << entry.path;
    }

    manager->RestoreVanilla();
    EXPECT_EQ(before, Snapshot(game));
}

TEST_F(ModManagerTest, MissingManifestIsRebuilt) {
    SetUpStockGame();
    auto before = Snapshot(game);
    {
        auto manager = Open();
        auto m = manager->RegisterMod(MakeModFolder("M", { { "maps/track.map", "mod track" } }));
        auto profile = manager->CreateProfile("P");
        manager->EnableMod(profile, m);
        manager->ActivateProfile(profile);
    }
    fs::remove(state / "manifest.json");

    auto manager = Open();
    EXPECT_EQ(1u, manager->ListMods().size());
    EXPECT_THAT(manager->ListProfiles(), IsEmpty());
    ASSERT_EQ(1u, manager->OverlayEntries().size());
    EXPECT_EQ("maps/track.map", manager->OverlayEntries()[0].path);

    manager->RestoreVanilla();
    EXPECT_EQ(before, Snapshot(game));
}

TEST_F(ModManagerTest, LostBackupIsUnrecoverable) {
    SetUpStockGame();
    auto manager = Open();
    auto m = manager->RegisterMod(MakeModFolder("M", { { "car/livery.dat", "mod" }, { "car/physics.dat", "mod" } }));
    auto profile = manager->CreateProfile("P");
    manager->EnableMod(profile, m);
    manager->ActivateProfile(profile);

    fs::remove(state / "backup" / "files" / "car" / "physics.dat");

    try {
        manager->RestoreVanilla();
        FAIL() << "expected UnrecoverableState";
    } catch (const ModException& ex) {
        EXPECT_EQ(ErrorKind::UnrecoverableState, ex.kind);
        EXPECT_THAT(ex.subjects, ElementsAre("car/physics.dat"));
    }

    EXPECT_EQ("stock livery", ReadGameFile("car/livery.dat"));
    EXPECT_FALSE(manager->ActiveProfile().has_value());
    ASSERT_EQ(1u, manager->OverlayEntries().size());
    EXPECT_EQ("car/physics.dat", manager->OverlayEntries()[0].path);
    EXPECT_FALSE(fs::exists(manager->JournalPath()));
}

TEST_F(ModManagerTest, OpensDespiteUnreadableSnapshot) {
    SetUpStockGame();
    {
        auto manager = Open();
        auto m = manager->RegisterMod(MakeModFolder("M", { { "car/livery.dat", "mod" } }));
        auto profile = manager->CreateProfile("P");
        manager->EnableMod(profile, m);
        manager->ActivateProfile(profile);
    }

    fs::create_symlink("stray.dat", state / "backup" / "files" / "stray.dat");

    std::unique_ptr<ModManager> manager;
    ASSERT_NO_THROW(manager = Open());
    ASSERT_EQ(1u, manager->OverlayEntries().size());
    EXPECT_EQ("car/livery.dat", manager->OverlayEntries()[0].path);

    manager->RestoreVanilla();
    EXPECT_EQ("stock livery", ReadGameFile("car/livery.dat"));
}

TEST_F(ModManagerTest, FailedActivationLeavesNoTrace) {
    WriteGameFile("car", "a file where a mod expects a folder");
    WriteGameFile("other.dat", "stock");
    auto before = Snapshot(game);

    auto manager = Open();
    auto m = manager->RegisterMod(MakeModFolder("M", { { "car/livery.dat", "mod" }, { "other.dat", "mod" } }));
    auto profile = manager->CreateProfile("P");
    manager->EnableMod(profile, m);

    EXPECT_EQ(ErrorKind::PartialApplyFailure, KindOf([&] { manager->ActivateProfile(profile); }));
    EXPECT_EQ(before, Snapshot(game));
    EXPECT_FALSE(manager->ActiveProfile().has_value());
    EXPECT_THAT(manager->OverlayEntries(), IsEmpty());
    EXPECT_THAT(manager->BackupEntries(), IsEmpty());
    EXPECT_FALSE(fs::exists(manager->JournalPath()));
}

// =============================================================================
// Profile Facade Tests
// =============================================================================

TEST_F(ModManagerTest, ProfileExportImportAcrossInstalls) {
    auto manager = Open();
    auto m = manager->RegisterMod(MakeModFolder("Shared Mod", { { "a.dat", "a" } }));
    auto profile = manager->CreateProfile("Mine");
    manager->EnableMod(profile, m);
    manager->RenameProfile(profile, "Mine v2");
    auto dup = manager->DuplicateProfile(profile);
    EXPECT_EQ("Mine v2 (Copy)", manager->GetProfile(dup).name);

    manager->ExportProfile(profile, base / "mine.json");

    auto other_game = base / "other-game";
    fs::create_directories(other_game);
    ModManager other(GameInstall { .game_id = "other", .root = other_game, .state_dir = base / "other-state" });
    auto imported = other.ImportProfile(base / "mine.json");

    EXPECT_EQ("Mine v2", other.GetProfile(imported).name);
    EXPECT_THAT(other.GetProfile(imported).mods, ElementsAre(m));
    // Mods are per install
    EXPECT_EQ(ErrorKind::DanglingModReference, KindOf([&] { other.ActivateProfile(imported); }));

    manager->DisableMod(profile, m);
    EXPECT_THAT(manager->GetProfile(profile).mods, IsEmpty());
}
