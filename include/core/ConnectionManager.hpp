#pragma once
/** @file  ConnectionManager.hpp
 *  @brief Owns at most one instrument handle per role and tracks its status.
 *
 *  © 2025 dcbench contributors — MIT-licensed.
 */

// STL headers
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

// dcbench headers
#include "core/ErrorMonitor.hpp" // ConnectionManager is a client to the error monitor
#include "instruments/InstrumentHandle.hpp"

namespace dcbench {
  namespace core {

    class ConnectionManager {
    public:
      /// Builds an unopened handle for (role, address, simulated).
      using HandleFactory = std::function<std::unique_ptr<instruments::InstrumentHandle>(
          instruments::InstrumentRole, const std::string&, bool)>;

      /// Runs on a freshly opened handle before it is registered; throwing DriverError refuses it.
      using Preparer = std::function<void(instruments::InstrumentHandle&)>;

      static constexpr int kDefaultSupplyChannels = 3;

      /// SCPI handles for hardware, Simulated* handles (echoing to std::clog) otherwise.
      static HandleFactory defaultFactory(int supplyChannels = kDefaultSupplyChannels);

      explicit ConnectionManager(std::shared_ptr<ErrorMonitor> errMonitor,
                                 HandleFactory factory = defaultFactory());
      ~ConnectionManager() = default;

      //---public APIs------------------------------------------------------
      /**
       * @brief Create, open and register a handle for \p role.
       *
       * Replaces the handle already held for the role. On failure nothing new
       * is registered and the previous handle (if any) is kept. \p prepare
       * (if set) runs after the handshake and before the swap.
       *
       * @throws instruments::ConnectionError with a human-readable cause.
       */
      instruments::InstrumentHandle& connect(instruments::InstrumentRole role,
                                             const std::string& address, bool simulated,
                                             const Preparer& prepare = {});
      void disconnect(instruments::InstrumentRole role);
      void disconnectAll();

      /// nullptr when no handle is registered for \p role.
      instruments::InstrumentHandle* handle(instruments::InstrumentRole role) const;
      instruments::OscilloscopeHandle* oscilloscope() const;
      instruments::PowerSupplyHandle* powerSupply() const;

      instruments::LinkStatus status(instruments::InstrumentRole role) const;
      std::vector<instruments::InstrumentRole> connectedRoles() const;
      bool anyConnected() const { return !handles_.empty(); }

    private:
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      HandleFactory factory_;
      std::map<instruments::InstrumentRole, std::unique_ptr<instruments::InstrumentHandle>> handles_;
    };

  } // namespace core
} // namespace dcbench
