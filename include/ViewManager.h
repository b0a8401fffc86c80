#pragma once

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

#include "GraphicsBackend.h"
#include "PixelBuffer.h"
#include "TileRenderer.h"

class ViewerSession;

/// Pack an 8-bit tile into RGBA texels (R in bits 0-7, A in bits 24-31).
/// 1 channel is grey, 2 is grey + alpha, 3 is RGB, 4 is RGBA; with more
/// channels the first three are shown as RGB.
void packRgba(const ByteImage& tile, std::vector<uint32_t>& out);

/// Keeps one tile renderer and one GPU texture per session and uploads the
/// tile whenever it was rebuilt.
class ViewManager {
public:
    explicit ViewManager(GraphicsBackend& backend);
    ~ViewManager();

    ViewManager(const ViewManager&) = delete;
    ViewManager& operator=(const ViewManager&) = delete;

    /// Render the session's visible tile and make sure its texture is
    /// current.  Returns nullptr when nothing is visible.
    const Texture* updateTileTexture(const ViewerSession& session);

    /// Geometry of the tile last returned for this session.
    const TilePlan* tilePlan(const ViewerSession& session) const;

    /// Release the texture of a session that is going away.
    void release(const ViewerSession& session);

    void destroyAllTextures();

private:
    struct Slot
    {
        TileRenderer renderer;
        std::unique_ptr<Texture> texture;
        uint64_t uploadedSerial = 0;
        bool uploaded = false;
    };

    void destroyTexture(Slot& slot);

    GraphicsBackend& backend_;
    std::unordered_map<const ViewerSession*, Slot> slots_;

    /// Reusable pixel buffer to avoid per-upload allocation.
    std::vector<uint32_t> pixelBuf_;
};
