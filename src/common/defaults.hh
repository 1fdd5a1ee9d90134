/* -*-mode:c++; tab-width: 2; indent-tabs-mode: nil; c-basic-offset: 2 -*- */

#pragma once

namespace xferd {

/* overridable through XFERD_SOCKET, XFERD_STORE and XFERD_AGENT */
constexpr char DEFAULT_SOCKET_PATH[] = "/tmp/xferd-agent.sock";
constexpr char DEFAULT_STORE_PATH[] = "/tmp/xferd-store.bin";
constexpr char DEFAULT_AGENT_COMMAND[] = "xferd-agent";

} // namespace xferd
