#pragma once

// Define version components
#define TOKEN_KEEPER_VERSION_MAJOR 1
#define TOKEN_KEEPER_VERSION_MINOR 0
#define TOKEN_KEEPER_VERSION_PATCH 0

// Helper macros for string conversion
#define TOKEN_KEEPER_STRINGIFY(x) #x
#define TOKEN_KEEPER_TOSTRING(x) TOKEN_KEEPER_STRINGIFY(x)

// Version as string in format "MAJOR.MINOR.PATCH"
#define TOKEN_KEEPER_VERSION_STRING                 \
  TOKEN_KEEPER_TOSTRING(TOKEN_KEEPER_VERSION_MAJOR) \
  "." TOKEN_KEEPER_TOSTRING(TOKEN_KEEPER_VERSION_MINOR) "." TOKEN_KEEPER_TOSTRING(TOKEN_KEEPER_VERSION_PATCH)
