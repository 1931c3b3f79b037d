#include "RecordingSurface.h"

RecordingSurface::Call RecordingSurface::makeCall(Op op) const
{
    Call call;
    call.op = op;
    call.transform = m_transform;
    return call;
}

void RecordingSurface::save()
{
    m_stack.push(m_transform);
    m_calls.append(makeCall(Op::Save));
}

void RecordingSurface::restore()
{
    if (!m_stack.isEmpty()) {
        m_transform = m_stack.pop();
    }
    m_calls.append(makeCall(Op::Restore));
}

void RecordingSurface::translate(qreal dx, qreal dy)
{
    m_transform.translate(dx, dy);
    Call call = makeCall(Op::Translate);
    call.a = dx;
    call.b = dy;
    m_calls.append(call);
}

void RecordingSurface::scale(qreal sx, qreal sy)
{
    m_transform.scale(sx, sy);
    Call call = makeCall(Op::Scale);
    call.a = sx;
    call.b = sy;
    m_calls.append(call);
}

void RecordingSurface::rotate(qreal degrees)
{
    m_transform.rotate(degrees);
    Call call = makeCall(Op::Rotate);
    call.a = degrees;
    m_calls.append(call);
}

void RecordingSurface::setHighQualityResampling(bool enabled)
{
    m_highQuality = enabled;
    Call call = makeCall(Op::Resampling);
    call.a = enabled ? 1.0 : 0.0;
    m_calls.append(call);
}

void RecordingSurface::clipToPath(const QPainterPath& path)
{
    Call call = makeCall(Op::Clip);
    call.rect = path.boundingRect();
    m_calls.append(call);
}

void RecordingSurface::clear(const QColor& color)
{
    Call call = makeCall(Op::Clear);
    call.color = color;
    call.rect = QRectF(QPointF(0, 0), QSizeF(m_size));
    m_calls.append(call);
}

void RecordingSurface::fillRect(const QRectF& rect, const QColor& color)
{
    Call call = makeCall(Op::FillRect);
    call.rect = rect;
    call.color = color;
    m_calls.append(call);
}

void RecordingSurface::fillPath(const QPainterPath& path, const QColor& color)
{
    Call call = makeCall(Op::FillPath);
    call.rect = path.boundingRect();
    call.color = color;
    m_calls.append(call);
}

void RecordingSurface::drawImage(const QRectF& target, const QImage& image)
{
    Call call = makeCall(Op::DrawImage);
    call.rect = target;
    call.imageSize = image.size();
    m_calls.append(call);
}

void RecordingSurface::strokeLine(const QLineF& line, const StrokeStyle& style)
{
    Call call = makeCall(Op::StrokeLine);
    call.line = line;
    call.style = style;
    m_calls.append(call);
}

void RecordingSurface::strokeRect(const QRectF& rect, const StrokeStyle& style)
{
    Call call = makeCall(Op::StrokeRect);
    call.rect = rect;
    call.style = style;
    m_calls.append(call);
}

void RecordingSurface::strokePath(const QPainterPath& path, const StrokeStyle& style)
{
    Call call = makeCall(Op::StrokePath);
    call.rect = path.boundingRect();
    call.style = style;
    m_calls.append(call);
}

void RecordingSurface::drawText(const QRectF& rect, const QString& text, const QColor& color)
{
    Call call = makeCall(Op::DrawText);
    call.rect = rect;
    call.text = text;
    call.color = color;
    m_calls.append(call);
}

QVector<RecordingSurface::Call> RecordingSurface::calls(Op op) const
{
    QVector<Call> result;
    for (const Call& call : m_calls) {
        if (call.op == op) {
            result.append(call);
        }
    }
    return result;
}

int RecordingSurface::count(Op op) const
{
    int n = 0;
    for (const Call& call : m_calls) {
        if (call.op == op) ++n;
    }
    return n;
}

void RecordingSurface::reset()
{
    m_transform = QTransform();
    m_stack.clear();
    m_highQuality = false;
    m_calls.clear();
}
