#include "ProcessBridge.h"

bool IsEvasiveGeometry(double x, double y, double width, double height) {
    // Off-screen or degenerate windows
    return x < -1000 || y < -1000 ||
           x > 10000 || y > 10000 ||
           width < 1 || height < 1;
}

bool IsElevatedLayer(int layer) {
    // kCGFloatingWindowLevel = 3, kCGModalPanelWindowLevel = 8, etc.
    return layer > kNormalWindowLayer;
}
