/**
 * expression_mapper.hpp — Blendshape categories to emotion labels
 *
 * Face-mesh backends report facial muscle activations (MediaPipe
 * blendshapes such as "mouthSmileLeft") rather than emotions. This maps
 * the few activations with a clear emotional reading onto the labels the
 * emotion extractor understands:
 *
 *   happy     — mouthSmileLeft / mouthSmileRight
 *   sad       — mouthFrownLeft / mouthFrownRight
 *   surprised — jawOpen / eyeWideLeft / eyeWideRight
 *   angry     — browDownLeft / browDownRight
 *
 * Each label takes the strongest of its categories. Category names are
 * matched case-insensitively with whitespace removed.
 */

#pragma once

#include <map>
#include <string>

namespace therapy_lens {

std::map<std::string, float> blendshapes_to_expressions(
    const std::map<std::string, float>& blendshapes
);

} // namespace therapy_lens
