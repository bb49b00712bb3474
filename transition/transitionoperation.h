/*
* ========================================================================== *
*                                                                            *
*    This file is part of the Letterbox player window layout engine          *
*                                                                            *
*    Copyright (C) 2024   <info@openterface.com>                             *
*                                                                            *
*    This program is free software: you can redistribute it and/or modify    *
*    it under the terms of the GNU General Public License as published by    *
*    the Free Software Foundation version 3.                                 *
*                                                                            *
*    This program is distributed in the hope that it will be useful, but     *
*    WITHOUT ANY WARRANTY; without even the implied warranty of              *
*    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU        *
*    General Public License for more details.                                *
*                                                                            *
*    You should have received a copy of the GNU General Public License       *
*    along with this program. If not, see <http://www.gnu.org/licenses/>.    *
*                                                                            *
* ========================================================================== *
*/

#ifndef TRANSITIONOPERATION_H
#define TRANSITIONOPERATION_H

#include <QString>
#include <QDebug>
#include <optional>

#include "geometry/windowgeometry.h"

/**
 * @brief Phases of a layout transition, in the order they run
 */
enum class OperationKind {
    PreTransition = 0,
    ShowFadeableViews,
    FadeOutOldViews,
    ExitLegacyFullScreenUncoverCameraHousing,
    CloseOldPanels,
    SuspendVideo,
    UpdateHiddenViewsAndConstraints,
    ResumeVideo,
    MoveWindowForMusicMode,
    OpenNewPanels,
    FadeInNewViews,
    EnterLegacyFullScreenCoverCameraHousing,
    PostTransition
};

enum class TimingCurve {
    Linear = 0,
    EaseIn,
    EaseOut,
    EaseInEaseOut
};

inline QString toString(OperationKind kind)
{
    switch (kind) {
    case OperationKind::PreTransition: return QStringLiteral("PreTransition");
    case OperationKind::ShowFadeableViews: return QStringLiteral("ShowFadeableViews");
    case OperationKind::FadeOutOldViews: return QStringLiteral("FadeOutOldViews");
    case OperationKind::ExitLegacyFullScreenUncoverCameraHousing: return QStringLiteral("ExitLegacyFullScreenUncoverCameraHousing");
    case OperationKind::CloseOldPanels: return QStringLiteral("CloseOldPanels");
    case OperationKind::SuspendVideo: return QStringLiteral("SuspendVideo");
    case OperationKind::UpdateHiddenViewsAndConstraints: return QStringLiteral("UpdateHiddenViewsAndConstraints");
    case OperationKind::ResumeVideo: return QStringLiteral("ResumeVideo");
    case OperationKind::MoveWindowForMusicMode: return QStringLiteral("MoveWindowForMusicMode");
    case OperationKind::OpenNewPanels: return QStringLiteral("OpenNewPanels");
    case OperationKind::FadeInNewViews: return QStringLiteral("FadeInNewViews");
    case OperationKind::EnterLegacyFullScreenCoverCameraHousing: return QStringLiteral("EnterLegacyFullScreenCoverCameraHousing");
    case OperationKind::PostTransition: return QStringLiteral("PostTransition");
    }
    return QStringLiteral("Unknown");
}

inline QString toString(TimingCurve timing)
{
    switch (timing) {
    case TimingCurve::Linear: return QStringLiteral("linear");
    case TimingCurve::EaseIn: return QStringLiteral("easeIn");
    case TimingCurve::EaseOut: return QStringLiteral("easeOut");
    case TimingCurve::EaseInEaseOut: return QStringLiteral("easeInEaseOut");
    }
    return QStringLiteral("unknown");
}

/**
 * @brief One step of a layout transition
 *
 * Pure data: the coordinator decides what each kind does. A zero duration step
 * only changes state and runs synchronously before the next timed step.
 */
struct TransitionOperation
{
    OperationKind kind = OperationKind::PreTransition;
    qreal duration = 0;     ///< Seconds
    TimingCurve timing = TimingCurve::Linear;
    /// Window geometry this step animates to, if it moves the window
    std::optional<WindowGeometry> geometry;

    TransitionOperation() = default;
    TransitionOperation(OperationKind kind, qreal duration, TimingCurve timing = TimingCurve::Linear,
                        std::optional<WindowGeometry> geometry = std::nullopt)
        : kind(kind), duration(duration), timing(timing), geometry(geometry) {}

    QString name() const { return ::toString(kind); }
    bool isZeroDuration() const { return duration <= 0; }
};

inline QDebug operator<<(QDebug dbg, const TransitionOperation &op)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace().noquote() << op.name() << "(" << op.duration << "s " << toString(op.timing)
                            << (op.geometry ? " +geometry" : "") << ")";
    return dbg;
}

#endif // TRANSITIONOPERATION_H
