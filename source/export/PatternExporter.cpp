#include "PatternExporter.h"
#include "../core/PatternSession.h"
#include "../render/Compositor.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QTimer>

PatternExporter::PatternExporter(PatternSession& session, QObject* parent)
    : QObject(parent)
    , m_session(session)
{
    qRegisterMetaType<ExportResult>("ExportResult");
}

PatternExporter::~PatternExporter()
{
    cancel();
}

ExportResult PatternExporter::rejection(const ExportRequest& request) const
{
    ExportResult result;
    result.request = request;
    if (m_exporting) {
        result.status = ExportStatus::Busy;
        result.message = QStringLiteral("An export is already in progress");
    } else if (!request.isValid()) {
        result.status = ExportStatus::InvalidRequest;
        result.message = QStringLiteral("Export size must be between %1 and %2")
                             .arg(ExportRequest::MIN_SIZE).arg(ExportRequest::MAX_SIZE);
    } else {
        result.status = ExportStatus::Success;
    }
    return result;
}

bool PatternExporter::requestExport(const ExportRequest& request)
{
    if (!m_session.hasPattern()) {
        qDebug() << "PatternExporter: no pattern loaded, export ignored";
        return false;
    }

    const ExportResult rejected = rejection(request);
    if (rejected.status != ExportStatus::Success) {
        qWarning() << "PatternExporter: export rejected:" << rejected.message;
        emit exportRejected(rejected);
        return false;
    }

    m_exporting = true;
    m_abort = false;
    m_pendingRequest = request;
    m_pendingState = m_session.state();
    m_pendingPattern = m_session.pattern();

    qDebug() << "PatternExporter: export scheduled" << request.suggestedFileName();
    emit exportStarted(request.size);

    QTimer::singleShot(DEFER_MS, this, &PatternExporter::runPending);
    return true;
}

void PatternExporter::runPending()
{
    QElapsedTimer timer;
    timer.start();

    ExportResult result = Compositor::exportPattern(m_pendingState, m_pendingPattern.get(),
                                                    m_pendingRequest, &m_abort);

    m_pendingPattern.reset();
    m_exporting = false;
    m_abort = false;

    if (result.succeeded()) {
        qDebug() << "PatternExporter: exported" << result.suggestedFileName()
                 << result.data.size() << "bytes in" << timer.elapsed() << "ms";
    } else {
        qWarning() << "PatternExporter: export failed:" << result.message;
    }
    emit exportFinished(result);
}

ExportResult PatternExporter::exportNow(const ExportRequest& request)
{
    if (m_exporting) {
        return rejection(request);
    }

    m_exporting = true;
    m_abort = false;
    ExportResult result = Compositor::exportPattern(m_session.state(), m_session.pattern().get(),
                                                    request, &m_abort);
    m_exporting = false;
    m_abort = false;
    return result;
}

void PatternExporter::cancel()
{
    if (m_exporting) {
        qDebug() << "PatternExporter: cancel requested";
        m_abort = true;
    }
}
