#pragma once

#include <QVariantMap>
#include <memory>
#include <string>

#include "OverlayBackend.hpp"
#include "OverlayStyle.hpp"
#include "OverlayWidget.hpp"

/**
 * @brief Counters shared between a FakeOverlayBackend and the test that created it.
 */
struct FakeBackendState
{
    int  created    = 0;
    int  live       = 0;
    int  startCalls = 0;
    int  stopCalls  = 0;
    int  processed  = 0;
    bool running    = false;
};

/**
 * @brief Headless widget: records calls, lets tests play the user's drag.
 */
class FakeOverlayWidget : public OverlayWidget
{
public:
    FakeOverlayWidget(OverlayKind                       kind,
                      const OverlayGeometry&            geometry,
                      const std::string&                label,
                      const QVariantMap&                style,
                      std::shared_ptr<FakeBackendState> state) :
        m_kind(kind),
        m_geometry(geometry),
        m_label(label),
        m_style(style),
        m_state(std::move(state))
    {
        ++m_state->live;
    }

    ~FakeOverlayWidget() override
    {
        --m_state->live;
    }

    void show() override
    {
        m_visible = true;
        ++showCalls;
    }

    void hide() override
    {
        m_visible = false;
        ++hideCalls;
    }

    bool isVisible() const override
    {
        return m_visible;
    }

    void setGeometry(const OverlayGeometry& geometry) override
    {
        m_geometry = geometry;
    }

    OverlayGeometry geometry() const override
    {
        return m_geometry;
    }

    void setLabel(const std::string& label) override
    {
        m_label = label;
    }

    void setStyle(const QVariantMap& style) override
    {
        OverlayStyle::validate(m_kind, style, StylePolicy::Passthrough);
        m_style = style;
    }

    void setGeometryChangedHandler(GeometryChangedFn fn) override
    {
        m_handler = std::move(fn);
    }

    /**
     * @brief What a real window does when the user drags it: move, then notify.
     */
    void simulateDrag(const OverlayGeometry& geometry, bool finished = true)
    {
        m_geometry = geometry;
        if (m_handler)
            m_handler(geometry, finished);
    }

    const std::string& label() const noexcept
    {
        return m_label;
    }

    const QVariantMap& style() const noexcept
    {
        return m_style;
    }

    int showCalls = 0;
    int hideCalls = 0;

private:
    OverlayKind                       m_kind;
    OverlayGeometry                   m_geometry;
    std::string                       m_label;
    QVariantMap                       m_style;
    std::shared_ptr<FakeBackendState> m_state;
    GeometryChangedFn                 m_handler;
    bool                              m_visible = false;
};

class FakeOverlayBackend : public OverlayBackend
{
public:
    explicit FakeOverlayBackend(std::shared_ptr<FakeBackendState> state = std::make_shared<FakeBackendState>()) :
        m_state(std::move(state))
    {
    }

    void startLoop() override
    {
        ++m_state->startCalls;
        m_state->running = true;
    }

    void stopLoop() noexcept override
    {
        ++m_state->stopCalls;
        m_state->running = false;
    }

    void processEvents() override
    {
        ++m_state->processed;
    }

    int exec() override
    {
        return 0;
    }

    std::unique_ptr<OverlayWidget> createWidget(OverlayKind            kind,
                                                const OverlayGeometry& geometry,
                                                const std::string&     label,
                                                const QVariantMap&     style) override
    {
        OverlayStyle::validate(kind, style, StylePolicy::Passthrough);
        ++m_state->created;
        return std::make_unique<FakeOverlayWidget>(kind, geometry, label, style, m_state);
    }

    const std::shared_ptr<FakeBackendState>& state() const noexcept
    {
        return m_state;
    }

private:
    std::shared_ptr<FakeBackendState> m_state;
};
