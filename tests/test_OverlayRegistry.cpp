#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "FakeOverlayBackend.hpp"
#include "GeometryStore.hpp"
#include "OverlayErrors.hpp"
#include "OverlayRegistry.hpp"
#include "PathUtilities.hpp"

namespace
{
    OverlayGeometry rect(int x, int y, int w, int h)
    {
        return OverlayGeometry{glm::ivec2(x, y), glm::ivec2(w, h)};
    }

    OverlayGeometry point(int x, int y)
    {
        return OverlayGeometry{glm::ivec2(x, y), glm::ivec2(0)};
    }

    class OverlayRegistryTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            ASSERT_TRUE(m_tmp.isValid());
            m_store = std::make_unique<GeometryStore>(PathUtil::toPath(m_tmp.path()));
            m_store->load();
        }

        FakeOverlayWidget* widget(OverlayRegistry& registry, OverlayKind kind, const std::string& id)
        {
            const OverlayRecord* rec = registry.find(kind, id);
            return rec ? static_cast<FakeOverlayWidget*>(rec->widget.get()) : nullptr;
        }

        QTemporaryDir                     m_tmp;
        std::unique_ptr<GeometryStore>    m_store;
        std::shared_ptr<FakeBackendState> m_state   = std::make_shared<FakeBackendState>();
        FakeOverlayBackend                m_backend = FakeOverlayBackend(m_state);
    };
} // namespace

TEST_F(OverlayRegistryTest, EnsureIsIdempotent)
{
    OverlayRegistry registry(m_backend, *m_store);

    registry.ensure(OverlayKind::Rect, "a", "", {}, {});
    const OverlayGeometry first = registry.get(OverlayKind::Rect, "a");
    registry.ensure(OverlayKind::Rect, "a", "", {}, {});

    EXPECT_EQ(m_state->created, 1);
    EXPECT_EQ(m_state->live, 1);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.get(OverlayKind::Rect, "a"), first);
}

TEST_F(OverlayRegistryTest, DefaultsApplyWhenNothingIsStored)
{
    OverlayRegistry registry(m_backend, *m_store);

    registry.ensure(OverlayKind::Rect, "r", "", {}, {});
    registry.ensure(OverlayKind::Point, "p", "", {}, {});

    EXPECT_EQ(registry.get(OverlayKind::Rect, "r").toRect(), config::kDefaultRect);
    EXPECT_EQ(registry.get(OverlayKind::Point, "p").toPoint(), config::kDefaultPoint);
}

TEST_F(OverlayRegistryTest, ExplicitFieldsOverrideStoredOneByOne)
{
    m_store->save(PersistedEntry{"a", OverlayKind::Rect, rect(10, 10, 50, 50)});

    OverlayRegistry registry(m_backend, *m_store);
    GeometryRequest request;
    request.width = 80;
    registry.ensure(OverlayKind::Rect, "a", "", request, {});

    EXPECT_EQ(registry.get(OverlayKind::Rect, "a"), rect(10, 10, 80, 50));
}

TEST_F(OverlayRegistryTest, ExplicitFieldsOverrideDefaults)
{
    OverlayRegistry registry(m_backend, *m_store);
    GeometryRequest request;
    request.x = 5;
    request.height = 300;
    registry.ensure(OverlayKind::Rect, "a", "", request, {});

    EXPECT_EQ(registry.get(OverlayKind::Rect, "a"), rect(5, config::kDefaultRect.y, config::kDefaultRect.width, 300));
}

TEST_F(OverlayRegistryTest, LabelFallsBackToIdAndIsReplaced)
{
    OverlayRegistry registry(m_backend, *m_store);

    registry.ensure(OverlayKind::Point, "ok", "", {}, {});
    EXPECT_EQ(widget(registry, OverlayKind::Point, "ok")->label(), "ok");

    registry.ensure(OverlayKind::Point, "ok", "OK button", {}, {{"point_color", "#00FF00"}});
    EXPECT_EQ(widget(registry, OverlayKind::Point, "ok")->label(), "OK button");
    EXPECT_EQ(registry.find(OverlayKind::Point, "ok")->label, "OK button");
    EXPECT_EQ(widget(registry, OverlayKind::Point, "ok")->style().value("point_color").toString(), "#00FF00");
}

TEST_F(OverlayRegistryTest, ReRegisterAppliesOnlyExplicitFieldsOverLiveGeometry)
{
    OverlayRegistry registry(m_backend, *m_store);
    registry.ensure(OverlayKind::Rect, "a", "", {}, {});

    widget(registry, OverlayKind::Rect, "a")->simulateDrag(rect(300, 200, 240, 160));

    GeometryRequest request;
    request.y = 7;
    registry.ensure(OverlayKind::Rect, "a", "", request, {});

    EXPECT_EQ(registry.get(OverlayKind::Rect, "a"), rect(300, 7, 240, 160));
    EXPECT_EQ(widget(registry, OverlayKind::Rect, "a")->geometry(), rect(300, 7, 240, 160));
}

TEST_F(OverlayRegistryTest, LiveDragUpdatesMemoryReleasePersists)
{
    OverlayRegistry registry(m_backend, *m_store);
    registry.ensure(OverlayKind::Rect, "a", "", {}, {});
    FakeOverlayWidget* w = widget(registry, OverlayKind::Rect, "a");

    w->simulateDrag(rect(40, 50, 240, 160), false);
    EXPECT_EQ(registry.get(OverlayKind::Rect, "a"), rect(40, 50, 240, 160));
    EXPECT_FALSE(m_store->contains(OverlayKind::Rect, "a"));

    w->simulateDrag(rect(60, 70, 240, 160), true);
    ASSERT_TRUE(m_store->contains(OverlayKind::Rect, "a"));
    EXPECT_EQ(m_store->get(OverlayKind::Rect, "a")->geometry, rect(60, 70, 240, 160));

    GeometryStore reopened(m_store->directory());
    reopened.load();
    EXPECT_EQ(reopened.get(OverlayKind::Rect, "a")->geometry, rect(60, 70, 240, 160));
}

TEST_F(OverlayRegistryTest, EveryChangePolicyPersistsLiveDrag)
{
    OverlayRegistry registry(m_backend, *m_store, config::PersistPolicy::EveryChange);
    registry.ensure(OverlayKind::Point, "p", "", {}, {});

    widget(registry, OverlayKind::Point, "p")->simulateDrag(point(11, 12), false);

    ASSERT_TRUE(m_store->contains(OverlayKind::Point, "p"));
    EXPECT_EQ(m_store->get(OverlayKind::Point, "p")->geometry, point(11, 12));
}

TEST_F(OverlayRegistryTest, NonPositiveRectEventIsIgnored)
{
    OverlayRegistry registry(m_backend, *m_store);
    registry.ensure(OverlayKind::Rect, "a", "", {}, {});

    registry.onGeometryChanged(OverlayKind::Rect, "a", rect(0, 0, 0, 100));

    EXPECT_EQ(registry.get(OverlayKind::Rect, "a").toRect(), config::kDefaultRect);
    EXPECT_FALSE(m_store->contains(OverlayKind::Rect, "a"));
}

TEST_F(OverlayRegistryTest, EventsForUnknownIdsAreIgnored)
{
    OverlayRegistry registry(m_backend, *m_store);

    EXPECT_NO_THROW(registry.onGeometryChanged(OverlayKind::Point, "ghost", point(1, 1)));
    EXPECT_FALSE(m_store->contains(OverlayKind::Point, "ghost"));
}

TEST_F(OverlayRegistryTest, GetFallsBackToStoreThenThrows)
{
    m_store->save(PersistedEntry{"saved", OverlayKind::Point, point(3, 4)});
    OverlayRegistry registry(m_backend, *m_store);

    EXPECT_EQ(registry.get(OverlayKind::Point, "saved"), point(3, 4));
    EXPECT_EQ(m_state->created, 0);
    EXPECT_THROW(static_cast<void>(registry.get(OverlayKind::Point, "nope")), NotFoundError);
}

TEST_F(OverlayRegistryTest, KindsHaveSeparateNamespaces)
{
    OverlayRegistry registry(m_backend, *m_store);

    GeometryRequest r;
    r.x = 1;
    r.y = 2;
    r.width = 100;
    r.height = 100;
    registry.ensure(OverlayKind::Rect, "a", "", r, {});

    GeometryRequest p;
    p.x = 9;
    p.y = 9;
    registry.ensure(OverlayKind::Point, "a", "", p, {});

    EXPECT_EQ(m_state->live, 2);
    EXPECT_EQ(registry.get(OverlayKind::Rect, "a"), rect(1, 2, 100, 100));
    EXPECT_EQ(registry.get(OverlayKind::Point, "a"), point(9, 9));
}

TEST_F(OverlayRegistryTest, HideAllShowAllKeepGeometry)
{
    OverlayRegistry registry(m_backend, *m_store);
    registry.ensure(OverlayKind::Rect, "a", "", {}, {});
    registry.ensure(OverlayKind::Point, "p", "", {}, {});
    FakeOverlayWidget* a = widget(registry, OverlayKind::Rect, "a");
    FakeOverlayWidget* p = widget(registry, OverlayKind::Point, "p");

    registry.hideAll();
    registry.hideAll();
    EXPECT_FALSE(a->isVisible());
    EXPECT_FALSE(p->isVisible());
    EXPECT_EQ(a->hideCalls, 1);

    registry.showAll();
    EXPECT_TRUE(a->isVisible());
    EXPECT_TRUE(p->isVisible());
    EXPECT_EQ(registry.get(OverlayKind::Rect, "a").toRect(), config::kDefaultRect);
}

TEST_F(OverlayRegistryTest, EnsureShowsHiddenOverlayAgain)
{
    OverlayRegistry registry(m_backend, *m_store);
    registry.ensure(OverlayKind::Rect, "a", "", {}, {});
    registry.hideAll();

    registry.ensure(OverlayKind::Rect, "a", "", {}, {});

    EXPECT_TRUE(widget(registry, OverlayKind::Rect, "a")->isVisible());
    EXPECT_TRUE(registry.find(OverlayKind::Rect, "a")->visible);
}

TEST_F(OverlayRegistryTest, RemoveReleasesWidgetKeepsStoredGeometry)
{
    OverlayRegistry registry(m_backend, *m_store);
    registry.ensure(OverlayKind::Rect, "a", "", {}, {});
    widget(registry, OverlayKind::Rect, "a")->simulateDrag(rect(5, 6, 70, 80));

    EXPECT_TRUE(registry.remove(OverlayKind::Rect, "a"));
    EXPECT_FALSE(registry.remove(OverlayKind::Rect, "a"));
    EXPECT_EQ(m_state->live, 0);
    EXPECT_EQ(registry.get(OverlayKind::Rect, "a"), rect(5, 6, 70, 80));
}

TEST_F(OverlayRegistryTest, InvalidRequestCreatesNothing)
{
    OverlayRegistry registry(m_backend, *m_store);

    GeometryRequest request;
    request.width = 0;
    EXPECT_THROW(registry.ensure(OverlayKind::Rect, "a", "", request, {}), InvalidGeometryError);

    EXPECT_THROW(registry.ensure(OverlayKind::Rect, "b", "", {}, {{"alpha", 2.0}}), InvalidStyleError);

    EXPECT_EQ(m_state->created, 0);
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(OverlayRegistryTest, RejectedRestyleLeavesRecordUntouched)
{
    OverlayRegistry registry(m_backend, *m_store);
    registry.ensure(OverlayKind::Rect, "a", "First", {}, {{"alpha", 0.5}});

    EXPECT_THROW(registry.ensure(OverlayKind::Rect, "a", "Second", {}, {{"alpha", -1}}), InvalidStyleError);

    EXPECT_EQ(registry.find(OverlayKind::Rect, "a")->label, "First");
    EXPECT_EQ(registry.find(OverlayKind::Rect, "a")->style.value("alpha").toDouble(), 0.5);
}

TEST_F(OverlayRegistryTest, StoreWriteFailureKeepsMemoryValue)
{
    // A regular file where the config directory should be.
    const std::filesystem::path blocker = PathUtil::toPath(m_tmp.path()) / "blocker";
    {
        QFile f(PathUtil::toQString(blocker));
        ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    }

    GeometryStore broken(blocker / "cfg");
    broken.load();

    OverlayRegistry registry(m_backend, broken);
    registry.ensure(OverlayKind::Point, "p", "", {}, {});

    // Through the widget: logged at the event boundary.
    EXPECT_NO_THROW(widget(registry, OverlayKind::Point, "p")->simulateDrag(point(20, 30)));
    EXPECT_EQ(registry.get(OverlayKind::Point, "p"), point(20, 30));

    // Direct delivery reports the failure.
    EXPECT_THROW(registry.onGeometryChanged(OverlayKind::Point, "p", point(40, 50)), StoreWriteError);
    EXPECT_EQ(registry.get(OverlayKind::Point, "p"), point(40, 50));
}

TEST_F(OverlayRegistryTest, DestroyAllReleasesEverything)
{
    OverlayRegistry registry(m_backend, *m_store);
    registry.ensure(OverlayKind::Rect, "a", "", {}, {});
    registry.ensure(OverlayKind::Point, "b", "", {}, {});

    registry.destroyAll();

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(m_state->live, 0);
}
