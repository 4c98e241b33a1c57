#include "flowcanvas/config/EditorConfig.h"

namespace flowcanvas {

namespace {

bool positive(const Size& size) {
    return size.width > 0.0f && size.height > 0.0f;
}

}  // namespace

bool EditorConfig::isValid() const {
    return historyCapacity >= 1 &&
           minNodeSize > 0.0f &&
           positive(defaultNodeSize) &&
           positive(defaultTextSize) &&
           shapeStyle.strokeWidth >= 0.0f &&
           textStyle.strokeWidth >= 0.0f &&
           zoomStep > 0.0f;
}

EditorConfig EditorConfig::defaults() {
    return EditorConfig{};
}

EditorConfig EditorConfig::compact() {
    EditorConfig config;
    config.historyCapacity = 20;
    config.defaultNodeSize = {80.0f, 50.0f};
    config.defaultTextSize = {80.0f, 24.0f};
    config.zoomStep = 0.05f;
    config.duplicateOffset = {10.0f, 10.0f};
    return config;
}

}  // namespace flowcanvas
