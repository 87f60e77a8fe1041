#ifndef MCPTOOLS_VERSION_HPP
#define MCPTOOLS_VERSION_HPP

// Version reported in serverInfo and by validar_configuracion.
#define MCPTOOLS_VERSION "1.0.0"

#endif // MCPTOOLS_VERSION_HPP
