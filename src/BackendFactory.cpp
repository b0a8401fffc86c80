#include "GraphicsBackend.h"

#include <stdexcept>

#ifdef HAS_OPENGL2
#include "OpenGL2Backend.h"
#endif

std::unique_ptr<GraphicsBackend> GraphicsBackend::create()
{
#ifdef HAS_OPENGL2
    return std::make_unique<OpenGL2Backend>();
#else
    throw std::runtime_error("No graphics backend compiled in");
#endif
}
