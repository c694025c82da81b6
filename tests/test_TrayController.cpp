// tests/test_TrayController.cpp
#include <gtest/gtest.h>
#include "TrayController.hpp"
#include "IconRenderer.hpp"
#include "AutostartManager.hpp"
#include "TestDoubles.hpp"
#include <QAction>
#include <QMenu>
#include <QTemporaryDir>

namespace percent_tray {
namespace testing {

class TrayControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto fake = std::make_unique<FakeTrayBackend>(QSize(24, 24));
        backend = fake.get();
        controller = std::make_unique<TrayController>(std::move(fake));

        RenderOptions options;
        options.style = IconStyle::Gauge;
        renderer = std::make_unique<IconRenderer>(options);
    }

    IconImage icon(int percentage) const {
        return *renderer->render(percentage, controller->iconSize());
    }

    FakeTrayBackend* backend{nullptr};
    std::unique_ptr<TrayController> controller;
    std::unique_ptr<IconRenderer> renderer;
};

TEST_F(TrayControllerTest, StartsUninitialized) {
    EXPECT_EQ(controller->state(), TrayController::State::Uninitialized);
    EXPECT_EQ(controller->iconSize(), QSize(24, 24));
    EXPECT_FALSE(controller->update(icon(10)));
    EXPECT_EQ(backend->setIconCalls, 0);
}

TEST_F(TrayControllerTest, StartCreatesTrayWithMenu) {
    ASSERT_TRUE(controller->start());
    EXPECT_EQ(controller->state(), TrayController::State::Active);
    EXPECT_EQ(backend->createCalls, 1);
    ASSERT_NE(backend->menu, nullptr);
    EXPECT_EQ(backend->menu, controller->menu());
    // Refresh, separator, Quit; no autostart entry without a manager
    EXPECT_EQ(controller->autostartAction(), nullptr);
    EXPECT_EQ(controller->menu()->actions().size(), 3);
}

TEST_F(TrayControllerTest, FailedCreationStaysUninitialized) {
    backend->createSucceeds = false;
    bool errorSeen = false;
    QObject::connect(controller.get(), &TrayController::errorOccurred,
        [&errorSeen](const std::string&) { errorSeen = true; });

    EXPECT_FALSE(controller->start());
    EXPECT_EQ(controller->state(), TrayController::State::Uninitialized);
    EXPECT_TRUE(errorSeen);
}

TEST_F(TrayControllerTest, UpdateSwapsIconAndToolTip) {
    ASSERT_TRUE(controller->start());

    ASSERT_TRUE(controller->update(icon(30), "Battery: 30%"));
    ASSERT_TRUE(controller->update(icon(31), "Battery: 31%"));

    ASSERT_EQ(backend->icons.size(), 2u);
    EXPECT_EQ(backend->icons.back(), icon(31).image);
    EXPECT_EQ(backend->toolTips.back(), QStringLiteral("Battery: 31%"));
    EXPECT_EQ(controller->currentIcon(), icon(31));
    EXPECT_EQ(controller->updateCount(), 2);
}

TEST_F(TrayControllerTest, RejectsEmptyIcons) {
    ASSERT_TRUE(controller->start());
    EXPECT_FALSE(controller->update(IconImage{}));
    EXPECT_EQ(backend->setIconCalls, 0);
}

TEST_F(TrayControllerTest, BackendRejectionKeepsPreviousIcon) {
    ASSERT_TRUE(controller->start());
    ASSERT_TRUE(controller->update(icon(40)));

    backend->failNextSetIcon = 1;
    EXPECT_FALSE(controller->update(icon(41)));
    EXPECT_EQ(controller->currentIcon(), icon(40));
    EXPECT_EQ(controller->updateCount(), 1);
}

TEST_F(TrayControllerTest, ShutdownIsTerminalAndReleasesTray) {
    ASSERT_TRUE(controller->start());
    controller->shutdown();

    EXPECT_EQ(controller->state(), TrayController::State::Terminated);
    EXPECT_EQ(backend->destroyCalls, 1);
    EXPECT_FALSE(backend->alive);
    EXPECT_FALSE(controller->update(icon(50)));
    EXPECT_FALSE(controller->start());

    controller->shutdown();
    EXPECT_EQ(backend->destroyCalls, 1);
}

TEST_F(TrayControllerTest, DestructionReleasesActiveTray) {
    ASSERT_TRUE(controller->start());
    bool released = false;
    backend->releasedFlag = &released;

    controller.reset();
    backend = nullptr;
    EXPECT_TRUE(released);
}

TEST_F(TrayControllerTest, EventsMapToSignals) {
    int refreshes = 0;
    int quits = 0;
    QObject::connect(controller.get(), &TrayController::refreshRequested, [&refreshes]() { ++refreshes; });
    QObject::connect(controller.get(), &TrayController::quitRequested, [&quits]() { ++quits; });

    // Ignored before start
    backend->trigger(TrayEvent::QuitRequested);
    EXPECT_EQ(quits, 0);

    ASSERT_TRUE(controller->start());
    backend->trigger(TrayEvent::RefreshRequested);
    controller->handleEvent(TrayEvent::QuitRequested);
    EXPECT_EQ(refreshes, 1);
    EXPECT_EQ(quits, 1);

    // Menu entries route through the same events
    const auto actions = controller->menu()->actions();
    actions.first()->trigger();
    actions.last()->trigger();
    EXPECT_EQ(refreshes, 2);
    EXPECT_EQ(quits, 2);
}

TEST_F(TrayControllerTest, ActivationShowsCurrentToolTip) {
    ASSERT_TRUE(controller->start());
    backend->trigger(TrayEvent::Activated);
    EXPECT_TRUE(backend->messages.empty());

    ASSERT_TRUE(controller->update(icon(64), "CPU: 64%"));
    backend->trigger(TrayEvent::Activated);
    ASSERT_EQ(backend->messages.size(), 1u);
    EXPECT_EQ(backend->messages.front().second, QStringLiteral("CPU: 64%"));
}

TEST(TrayControllerAutostartTest, MenuTogglesAutostart) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    AutostartManager autostart(dir.filePath("autostart/percent-tray.desktop"), "/usr/bin/percent-tray");

    auto fake = std::make_unique<FakeTrayBackend>();
    TrayController controller(std::move(fake), &autostart);
    ASSERT_TRUE(controller.start());

    QAction* action = controller.autostartAction();
    ASSERT_NE(action, nullptr);
    EXPECT_EQ(action->text(), QStringLiteral("Enable autostart"));

    action->trigger();
    EXPECT_TRUE(autostart.isEnabled());
    EXPECT_EQ(action->text(), QStringLiteral("Disable autostart"));

    controller.handleEvent(TrayEvent::ToggleAutostart);
    EXPECT_FALSE(autostart.isEnabled());
    EXPECT_EQ(action->text(), QStringLiteral("Enable autostart"));
}

} // namespace testing
} // namespace percent_tray
