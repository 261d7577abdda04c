#pragma once

// Injected by the build; see CMakeLists.txt
#ifndef TFMCP_VERSION
#define TFMCP_VERSION "version"
#endif

#ifndef TFMCP_COMMIT
#define TFMCP_COMMIT "commit"
#endif

#ifndef TFMCP_BUILD_DATE
#define TFMCP_BUILD_DATE "date"
#endif

#define TFMCP_SERVER_NAME "terraform-mcp-server"
