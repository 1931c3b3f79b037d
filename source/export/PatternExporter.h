#pragma once

/**
 * @file PatternExporter.h
 * @brief Serialized, deferred export of the current pattern session.
 *
 * Only one export runs at a time: a request made while another is pending or
 * rendering is rejected, never queued behind it. Accepted requests are
 * deferred by DEFER_MS on the event loop so the UI can show its busy state
 * before the (blocking) render starts.
 *
 * The render state and pattern are captured when the request is accepted, so
 * slider changes during the deferral do not leak into the exported image.
 */

#include "ExportTypes.h"
#include "../core/PatternImage.h"
#include "../core/RenderState.h"

#include <QObject>
#include <atomic>

class PatternSession;

class PatternExporter : public QObject
{
    Q_OBJECT

public:
    /// Delay between accepting a request and starting the render.
    static constexpr int DEFER_MS = 100;

    /**
     * @param session Session to export from (not owned, must outlive the exporter).
     */
    explicit PatternExporter(PatternSession& session, QObject* parent = nullptr);
    ~PatternExporter() override;

    /**
     * @brief Schedule an export.
     *
     * No pattern: no-op, returns false and emits nothing.
     * Busy or invalid size: emits exportRejected() and returns false.
     * Otherwise emits exportStarted(), renders after DEFER_MS and emits
     * exportFinished().
     */
    bool requestExport(const ExportRequest& request);

    /**
     * @brief Render and encode immediately, bypassing the deferral.
     *
     * Still serialized: returns ExportStatus::Busy while a deferred export is
     * pending.
     */
    ExportResult exportNow(const ExportRequest& request);

    bool isExporting() const { return m_exporting; }

    /**
     * @brief Abort the pending or running export.
     *
     * The render stops at the next column of tiles and the export finishes
     * with ExportStatus::Cancelled. No effect when idle.
     */
    void cancel();

signals:
    void exportStarted(int size);
    void exportRejected(const ExportResult& result);
    void exportFinished(const ExportResult& result);

private slots:
    void runPending();

private:
    PatternExporter(const PatternExporter&) = delete;
    PatternExporter& operator=(const PatternExporter&) = delete;

    ExportResult rejection(const ExportRequest& request) const;

    PatternSession& m_session;

    // Captured at request time
    ExportRequest m_pendingRequest;
    RenderState m_pendingState;
    PatternImagePtr m_pendingPattern;

    std::atomic<bool> m_exporting{false};
    std::atomic<bool> m_abort{false};
};
