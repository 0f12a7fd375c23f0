#pragma once
#include "GridTypes.hpp"
#include "GridTheme.hpp"

class DimensionResolver;
class ViewportLayout;
class FreezeGeometry;
class MergeIndex;
class StyleHookRegistry;
class FontCache;
struct HitTestTuning;

/*
    IFrameAccessor — Interface for layers to access one frame's derived state.

    Decouples layers from the render session: the session resolves dimensions,
    zones, merges and the animated geometry once per frame and layers "pull" what they need.
*/
class IFrameAccessor {
public:
    virtual ~IFrameAccessor() = default;

    // --- Snapshot ---
    virtual const GridFrame& getFrame() const = 0;

    // --- Derived geometry ---
    virtual const DimensionResolver& getDimensions() const = 0;
    virtual const ViewportLayout& getLayout() const = 0;
    virtual const FreezeGeometry& getGeometry() const = 0;
    virtual const MergeIndex& getMerges() const = 0;

    // --- Look & hooks ---
    virtual const GridTheme& getTheme() const = 0;
    virtual const HitTestTuning& getTuning() const = 0;
    virtual const StyleHookRegistry* getStyleHooks() const = 0;
    virtual FontCache& getFontCache() const = 0;
};
