#include "ViewManager.h"

#include "ViewerSession.h"

namespace {

inline uint32_t rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a)
{
    return static_cast<uint32_t>(r) |
           (static_cast<uint32_t>(g) << 8) |
           (static_cast<uint32_t>(b) << 16) |
           (static_cast<uint32_t>(a) << 24);
}

} // namespace

void packRgba(const ByteImage& tile, std::vector<uint32_t>& out)
{
    const size_t n = static_cast<size_t>(tile.width) * tile.height;
    out.resize(n);
    const int c = tile.channels;
    const uint8_t* src = tile.data.data();

    for (size_t i = 0; i < n; ++i, src += c)
    {
        switch (c)
        {
        case 1:  out[i] = rgba(src[0], src[0], src[0], 255); break;
        case 2:  out[i] = rgba(src[0], src[0], src[0], src[1]); break;
        case 4:  out[i] = rgba(src[0], src[1], src[2], src[3]); break;
        default: out[i] = rgba(src[0], src[1], src[2], 255); break;
        }
    }
}

ViewManager::ViewManager(GraphicsBackend& backend)
    : backend_(backend) {}

ViewManager::~ViewManager()
{
    destroyAllTextures();
}

const Texture* ViewManager::updateTileTexture(const ViewerSession& session)
{
    Slot& slot = slots_[&session];

    if (!session.hasImage())
    {
        destroyTexture(slot);
        slot.renderer.invalidate();
        return nullptr;
    }

    const Tile& tile = slot.renderer.render(session.display(), session.displayGeneration(),
                                            session.viewport(), session.interpolation());
    if (!tile.plan.visible || tile.bitmap.empty())
        return nullptr;

    if (slot.uploaded && slot.uploadedSerial == tile.serial)
        return slot.texture.get();

    packRgba(tile.bitmap, pixelBuf_);

    if (slot.texture)
        backend_.updateTexture(slot.texture.get(), tile.bitmap.width, tile.bitmap.height,
                               pixelBuf_.data());
    else
        slot.texture = backend_.createTexture(tile.bitmap.width, tile.bitmap.height,
                                              pixelBuf_.data());
    slot.uploaded = true;
    slot.uploadedSerial = tile.serial;
    return slot.texture.get();
}

const TilePlan* ViewManager::tilePlan(const ViewerSession& session) const
{
    auto it = slots_.find(&session);
    if (it == slots_.end())
        return nullptr;
    return &it->second.renderer.tile().plan;
}

void ViewManager::release(const ViewerSession& session)
{
    auto it = slots_.find(&session);
    if (it == slots_.end())
        return;
    destroyTexture(it->second);
    slots_.erase(it);
}

void ViewManager::destroyTexture(Slot& slot)
{
    if (slot.texture)
    {
        backend_.destroyTexture(slot.texture.get());
        slot.texture.reset();
    }
    slot.uploaded = false;
}

void ViewManager::destroyAllTextures()
{
    for (auto& entry : slots_)
        destroyTexture(entry.second);
    slots_.clear();
}
