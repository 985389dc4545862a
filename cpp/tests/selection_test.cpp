#include "tests/engine_test_common.h"
#include "tint/entity/entity_registry.h"
#include "tint/entity/selection_manager.h"
#include "tint/event/event_stream.h"

using namespace tint;
using namespace tint_test;

namespace {

class SelectionFixture : public ::testing::Test {
protected:
    void SetUp() override {
        registry.reconcile({makeWall(1), makeWall(2)}, ReconcileFilter{}, 0.0, selection, events);
        events.discardPending();
    }

    int selectedCount() const {
        int count = 0;
        for (const auto& wall : registry.all()) {
            if (wall.isSelected()) count++;
        }
        return count;
    }

    EntityRegistry registry;
    EventStream events;
    SelectionManager selection{registry, events};
};

} // namespace

TEST_F(SelectionFixture, SwitchingSelectionEmitsOnlyFinalSelection) {
    ASSERT_EQ(selection.select(1), TintError::Ok);
    ASSERT_EQ(selection.select(2), TintError::Ok);
    const auto pending = events.takePending();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(*pending[0].selection, 1u);
    EXPECT_EQ(*pending[1].selection, 2u);
    EXPECT_EQ(selectedCount(), 1);
    EXPECT_TRUE(registry.find(2)->isSelected());
    EXPECT_FALSE(registry.find(1)->isSelected());
}

TEST_F(SelectionFixture, UnknownIdIsNotFoundAndKeepsSelection) {
    selection.select(1);
    const std::uint32_t generation = selection.getGeneration();
    events.discardPending();

    EXPECT_EQ(selection.select(42), TintError::NotFound);
    EXPECT_EQ(*selection.currentId(), 1u);
    EXPECT_EQ(selection.getGeneration(), generation);
    EXPECT_FALSE(events.hasPending());
}

TEST_F(SelectionFixture, ReselectingIsSilent) {
    selection.select(1);
    events.discardPending();
    EXPECT_EQ(selection.select(1), TintError::Ok);
    EXPECT_FALSE(events.hasPending());
}

TEST_F(SelectionFixture, DeselectClearsFlag) {
    selection.select(1);
    EXPECT_TRUE(selection.deselect());
    EXPECT_FALSE(selection.deselect());
    EXPECT_EQ(selectedCount(), 0);
    EXPECT_FALSE(selection.current().has_value());
}

TEST_F(SelectionFixture, PruneDropsDanglingSelection) {
    selection.select(1);
    registry.reset();
    events.discardPending();
    selection.prune();
    EXPECT_FALSE(selection.hasSelection());
    ASSERT_TRUE(events.hasPending());
}
