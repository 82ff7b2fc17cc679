// Single translation unit that compiles LodePNG.
//
// The build passes the directory holding the upstream lodepng.cpp / lodepng.h on the include
// path (LODEPNG_DIR in CMakeLists.txt). Compiling it here means no separate build rule for an
// external source path.
//
// Do not include "lodepng.cpp" from anywhere else.
#include "lodepng.cpp"
