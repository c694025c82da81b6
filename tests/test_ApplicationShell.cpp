// tests/test_ApplicationShell.cpp
#include <gtest/gtest.h>
#include "ApplicationShell.hpp"
#include "TrayController.hpp"
#include "IconRenderer.hpp"
#include "ConfigManager.hpp"
#include "TestDoubles.hpp"
#include "percent-tray/Constants.hpp"
#include <QFontDatabase>
#include <QSignalSpy>

namespace percent_tray {
namespace testing {

class ApplicationShellTest : public ::testing::Test {
protected:
    void build(std::deque<std::optional<PercentageReading>> script,
               IconStyle style = IconStyle::Gauge,
               QSize iconSize = QSize(32, 32)) {
        RenderOptions options;
        options.style = style;
        build(std::move(script), options, iconSize);
    }

    void build(std::deque<std::optional<PercentageReading>> script,
               const RenderOptions& options,
               QSize iconSize) {
        auto fakeSource = std::make_unique<ScriptedSource>(std::move(script));
        source = fakeSource.get();

        auto fakeBackend = std::make_unique<FakeTrayBackend>(iconSize);
        backend = fakeBackend.get();

        expected = std::make_unique<IconRenderer>(options);

        shell = std::make_unique<ApplicationShell>(
            std::move(fakeSource),
            std::make_unique<IconRenderer>(options),
            std::make_unique<TrayController>(std::move(fakeBackend)),
            POLLING_INTERVAL);
    }

    QImage expectedImage(double percentage, ChargeState state = ChargeState::Unknown) const {
        return expected->render(percentage, backend->size, state)->image;
    }

    ScriptedSource* source{nullptr};
    FakeTrayBackend* backend{nullptr};
    std::unique_ptr<IconRenderer> expected;
    std::unique_ptr<ApplicationShell> shell;
};

TEST_F(ApplicationShellTest, StartShowsFirstReadingImmediately) {
    build({reading(42)});
    ASSERT_TRUE(shell->start());
    EXPECT_TRUE(shell->isRunning());

    ASSERT_EQ(backend->icons.size(), 1u);
    EXPECT_EQ(backend->icons.front(), expectedImage(42));
    EXPECT_EQ(backend->toolTips.front(), QStringLiteral("Scripted: 42%"));
    ASSERT_TRUE(shell->lastReading().has_value());
    EXPECT_EQ(shell->lastReading()->rounded(), 42);
}

TEST_F(ApplicationShellTest, StartFailsWithoutTray) {
    build({reading(42)});
    backend->createSucceeds = false;

    EXPECT_FALSE(shell->start());
    EXPECT_FALSE(shell->isRunning());
    EXPECT_EQ(source->reads, 0);
}

TEST_F(ApplicationShellTest, SequenceYieldsFiveDistinctIcons) {
    build({reading(0), reading(25), reading(50), reading(75), reading(100)});
    ASSERT_TRUE(shell->start());
    for (int i = 0; i < 4; ++i) {
        shell->tick();
    }

    ASSERT_EQ(backend->icons.size(), 5u);
    const int values[] = {0, 25, 50, 75, 100};
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(backend->icons[i], expectedImage(values[i])) << "value " << values[i];
        EXPECT_EQ(backend->icons[i].size(), backend->size);
        for (size_t j = 0; j < i; ++j) {
            EXPECT_NE(backend->icons[i], backend->icons[j]);
        }
    }
}

TEST_F(ApplicationShellTest, NumeralSequenceMatchesRenderedNumerals) {
    if (QFontDatabase::families().isEmpty()) {
        GTEST_SKIP() << "no fonts installed";
    }
    build({reading(0), reading(25), reading(50), reading(75), reading(100)},
          IconStyle::Numeral, QSize(DEFAULT_ICON_SIZE, DEFAULT_ICON_SIZE));
    ASSERT_TRUE(shell->start());
    for (int i = 0; i < 4; ++i) {
        shell->tick();
    }

    ASSERT_EQ(backend->icons.size(), 5u);
    const int values[] = {0, 25, 50, 75, 100};
    for (size_t i = 0; i < 5; ++i) {
        EXPECT_EQ(backend->icons[i], expectedImage(values[i]));
    }
}

TEST_F(ApplicationShellTest, ReadFailureKeepsPreviousIcon) {
    build({reading(50), std::nullopt, std::nullopt, reading(60)});
    QSignalSpy failures(shell.get(), &ApplicationShell::readFailed);

    ASSERT_TRUE(shell->start());
    shell->tick();
    shell->tick();

    // Failed reads never reach the tray
    EXPECT_EQ(backend->setIconCalls, 1);
    EXPECT_EQ(failures.count(), 2);
    EXPECT_EQ(shell->lastReading()->rounded(), 50);
    EXPECT_EQ(shell->trayController()->currentIcon().percentage, 50);

    shell->tick();
    ASSERT_EQ(backend->icons.size(), 2u);
    EXPECT_EQ(backend->icons[0], expectedImage(50));
    EXPECT_EQ(backend->icons[1], expectedImage(60));
    for (const QImage& image : backend->icons) {
        EXPECT_FALSE(image.isNull());
    }
}

TEST_F(ApplicationShellTest, UnchangedValueIsNotRedrawn) {
    build({reading(33.2), reading(32.8), reading(33, ChargeState::Charging)});
    ASSERT_TRUE(shell->start());
    shell->tick();
    EXPECT_EQ(backend->setIconCalls, 1);

    // A change of charge state is a change
    shell->tick();
    EXPECT_EQ(backend->setIconCalls, 2);
    EXPECT_EQ(backend->icons.back(), expectedImage(33, ChargeState::Charging));
}

TEST_F(ApplicationShellTest, FailedTrayUpdateIsRetriedOnNextTick) {
    build({reading(70), reading(70)});
    backend->failNextSetIcon = 1;
    QSignalSpy updates(shell.get(), &ApplicationShell::iconUpdated);

    ASSERT_TRUE(shell->start());
    EXPECT_TRUE(backend->icons.empty());
    EXPECT_EQ(updates.count(), 0);

    shell->tick();
    ASSERT_EQ(backend->icons.size(), 1u);
    EXPECT_EQ(backend->icons.front(), expectedImage(70));
    ASSERT_EQ(updates.count(), 1);
    EXPECT_EQ(updates.first().first().toInt(), 70);
}

TEST_F(ApplicationShellTest, RenderFailureFallsBackToDefaultIcon) {
    build({reading(10)}, IconStyle::Gauge, QSize(4, 4));
    ASSERT_TRUE(shell->start());

    ASSERT_EQ(backend->icons.size(), 1u);
    EXPECT_EQ(backend->icons.front().size(), QSize(4, 4));
    EXPECT_TRUE(shell->trayController()->currentIcon().fallback);
    EXPECT_EQ(backend->icons.front(), expected->defaultIcon(QSize(4, 4)).image);
}

TEST_F(ApplicationShellTest, UndrawableNumeralFallsBackToDefaultIcon) {
    RenderOptions options;
    options.style = IconStyle::Numeral;
    options.foreground = Qt::transparent;
    options.background = Qt::transparent;
    build({reading(55)}, options, QSize(32, 32));
    QSignalSpy updates(shell.get(), &ApplicationShell::iconUpdated);

    ASSERT_TRUE(shell->start());

    ASSERT_EQ(backend->icons.size(), 1u);
    EXPECT_EQ(backend->icons.front(), expected->defaultIcon(QSize(32, 32)).image);
    EXPECT_TRUE(shell->trayController()->currentIcon().fallback);
    EXPECT_EQ(updates.count(), 0);
}

TEST_F(ApplicationShellTest, FallbackIconIsRetriedOnNextTick) {
    build({reading(10), reading(10)}, IconStyle::Gauge, QSize(4, 4));
    ASSERT_TRUE(shell->start());
    EXPECT_EQ(backend->setIconCalls, 1);

    // Same value, but the last render failed: try again
    shell->tick();
    EXPECT_EQ(source->reads, 2);
    EXPECT_EQ(backend->setIconCalls, 2);
    EXPECT_TRUE(shell->trayController()->currentIcon().fallback);
}

TEST_F(ApplicationShellTest, OutOfRangeReadingsAreClamped) {
    build({reading(150), reading(-5)});
    ASSERT_TRUE(shell->start());
    shell->tick();

    ASSERT_EQ(backend->icons.size(), 2u);
    EXPECT_EQ(backend->icons[0], expectedImage(100));
    EXPECT_EQ(backend->icons[1], expectedImage(0));
    EXPECT_DOUBLE_EQ(shell->lastReading()->value, 0.0);
}

TEST_F(ApplicationShellTest, RefreshForcesRedraw) {
    build({reading(80), reading(80)});
    ASSERT_TRUE(shell->start());

    backend->trigger(TrayEvent::RefreshRequested);
    EXPECT_EQ(source->reads, 2);
    EXPECT_EQ(backend->setIconCalls, 2);
}

TEST_F(ApplicationShellTest, QuitStopsAndReleasesTray) {
    build({reading(80)});
    QSignalSpy finished(shell.get(), &ApplicationShell::finished);
    ASSERT_TRUE(shell->start());

    backend->trigger(TrayEvent::QuitRequested);
    EXPECT_FALSE(shell->isRunning());
    EXPECT_EQ(finished.count(), 1);
    EXPECT_EQ(shell->trayController()->state(), TrayController::State::Terminated);
    EXPECT_EQ(backend->destroyCalls, 1);

    shell->tick();
    EXPECT_EQ(source->reads, 1);
}

TEST(ApplicationShellConfigTest, BuildsFromConfiguration) {
    ConfigManager config;
    config.setString(ConfigKeys::METRIC, "cpu");
    config.setString(ConfigKeys::ICON_STYLE, "gauge");
    config.setInt(ConfigKeys::POLL_INTERVAL, 2500);
    config.setString(ConfigKeys::FOREGROUND_COLOR, "#ffffff");

    auto shell = ApplicationShell::fromConfig(config, std::make_unique<FakeTrayBackend>());
    ASSERT_NE(shell, nullptr);
    EXPECT_EQ(shell->pollInterval(), 2500);
    EXPECT_EQ(shell->renderer().options().style, IconStyle::Gauge);
    EXPECT_EQ(shell->renderer().options().foreground, QColor(Qt::white));

    auto source = ApplicationShell::createSource(config);
    EXPECT_EQ(source->name(), QStringLiteral("CPU"));

    config.setString(ConfigKeys::METRIC, "disk");
    config.setString(ConfigKeys::DISK_PATH, "/tmp");
    EXPECT_EQ(ApplicationShell::createSource(config)->name(), QStringLiteral("Disk /tmp"));

    config.setString(ConfigKeys::METRIC, "battery");
    EXPECT_EQ(ApplicationShell::createSource(config)->name(), QStringLiteral("Battery"));
}

} // namespace testing
} // namespace percent_tray
