#ifndef GEOGRID_H_INCLUDED
#define GEOGRID_H_INCLUDED

// Ensure proper DLL export/import on Windows
#ifdef _WIN32
#ifdef GEOGRID_BUILDING
#define GEOGRID_DLL __declspec(dllexport)
#else
#define GEOGRID_DLL __declspec(dllimport)
#endif
#else
#define GEOGRID_DLL
#endif

#define GEOGRID_VERSION_MAJOR 1
#define GEOGRID_VERSION_MINOR 0

#endif /* GEOGRID_H_INCLUDED */
