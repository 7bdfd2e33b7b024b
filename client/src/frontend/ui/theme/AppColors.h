#ifndef APPCOLORS_H
#define APPCOLORS_H

#include <QColor>

/**
 * @brief Centralized colors for the composition canvas
 *
 * Everything the painter draws that does not come from the scene itself
 * (fallback background, empty-canvas prompt, selection chrome, text shadow).
 */

namespace AppColors {

// ============================================================================
// CANVAS
// ============================================================================

extern QColor gCanvasDefaultBackground;      // Background when none is set or the color is invalid
extern QColor gCanvasPromptText;             // "Upload images to begin" prompt
extern int gCanvasPromptFontSizePx;

// ============================================================================
// SELECTION CHROME
// ============================================================================

extern QColor gSelectionOutline;             // Outline and resize glyph of the selected image
extern qreal gSelectionOutlineWidth;

// ============================================================================
// TEXT LAYERS
// ============================================================================

extern QColor gTextShadow;                   // Drop shadow behind text layers
extern QColor gTextFallback;                 // Text/background color when a layer's CSS color is invalid

} // namespace AppColors

#endif // APPCOLORS_H
