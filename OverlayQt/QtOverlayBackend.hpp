#ifndef QTOVERLAYBACKEND_HPP
#define QTOVERLAYBACKEND_HPP

#include <memory>

#include "OverlayBackend.hpp"

class QApplication;

/**
 * @brief OverlayBackend on Qt 6 Widgets.
 *
 * startLoop() reuses the running QApplication, or creates one owned by the
 * backend when the host has none. stopLoop() quits the loop and, if the
 * application is owned, deletes it once no exec() is on the stack.
 */
class QtOverlayBackend : public OverlayBackend
{
public:
    QtOverlayBackend();
    ~QtOverlayBackend() override;

    QtOverlayBackend(const QtOverlayBackend&)            = delete;
    QtOverlayBackend& operator=(const QtOverlayBackend&) = delete;

    void startLoop() override;
    void stopLoop() noexcept override;
    void processEvents() override;
    int  exec() override;

    std::unique_ptr<OverlayWidget> createWidget(OverlayKind            kind,
                                                const OverlayGeometry& geometry,
                                                const std::string&     label,
                                                const QVariantMap&     style) override;

    bool started() const noexcept
    {
        return m_started;
    }

    /**
     * @brief True if the QApplication was created by this backend.
     */
    bool ownsApplication() const noexcept
    {
        return m_ownedApp != nullptr;
    }

private:
    void releaseApplication() noexcept;

private:
    std::unique_ptr<QApplication> m_ownedApp;

    bool m_started = false;
    bool m_inExec  = false;
};

#endif // QTOVERLAYBACKEND_HPP
