#include "frontend/ui/theme/AppColors.h"

namespace AppColors {

// ============================================================================
// CANVAS
// ============================================================================

QColor gCanvasDefaultBackground = QColor(0xF3, 0xF4, 0xF6);
QColor gCanvasPromptText = QColor(0x6B, 0x72, 0x80);
int gCanvasPromptFontSizePx = 24;

// ============================================================================
// SELECTION CHROME
// ============================================================================

QColor gSelectionOutline = QColor(0x84, 0xCC, 0x16);
qreal gSelectionOutlineWidth = 2.0;

// ============================================================================
// TEXT LAYERS
// ============================================================================

QColor gTextShadow = QColor(0, 0, 0, 191);
QColor gTextFallback = QColor(0, 0, 0);

} // namespace AppColors
