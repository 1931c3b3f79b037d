// ============================================================================
// qt_compat.h - Qt5 / Qt6 compatibility shims for PatternProof
// ============================================================================
// Include this header in .cpp files that touch the pointer/touch event APIs
// that changed between Qt5 and Qt6. Everything else in the code base compiles
// against both versions without guards.
// ============================================================================
#pragma once

#include <QtCore/qglobal.h>
#include <QTouchEvent>

// ============================================================================
// Touch-point types
// ============================================================================
// Qt6: QEventPoint, event->points(), pt.position()
// Qt5: QTouchEvent::TouchPoint, event->touchPoints(), pt.pos()
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#  include <QEventPoint>
   using PP_TouchPoint = QEventPoint;
#  define PP_TOUCH_POINTS(event)   (event)->points()
#  define PP_TP_POS(pt)            (pt).position()
#else
   using PP_TouchPoint = QTouchEvent::TouchPoint;
#  define PP_TOUCH_POINTS(event)   (event)->touchPoints()
#  define PP_TP_POS(pt)            (pt).pos()
#endif

// ============================================================================
// Pointer event position (QPointF)
// ============================================================================
// Qt6 unified all events under QSinglePointEvent::position().
// Qt5 QMouseEvent exposes the same value through localPos().
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#  define PP_MOUSE_POS(event)    (event)->position()
#else
#  define PP_MOUSE_POS(event)    (event)->localPos()
#endif
// QWheelEvent::position() exists since Qt 5.14, so works in both Qt5.15 and Qt6.
#define PP_WHEEL_POS(event)      (event)->position()

