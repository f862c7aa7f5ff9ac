// =============================================================================
// stb_image / stb_image_write implementation unit
// =============================================================================
// Owns both *_IMPLEMENTATION macros to avoid duplicate definitions.

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
