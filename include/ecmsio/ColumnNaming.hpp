#pragma once
#include <optional>
#include <string>

namespace ecmsio {

// reserved block holding the embedded potentiostat log
inline const std::string kEcLabBlock        = "EC-lab";
inline const std::string kPotentialBlock    = "pot";
inline const std::string kExperimentColumn  = "experiment_number";
inline const std::string kTechniqueColumn   = "technique_number";

// elapsed-time header of the native format and of the embedded log
inline const std::string kNativeTimeHeader  = "Time [s]";
inline const std::string kEcLabTimeHeader   = "time/s";

struct ColumnName
{
    std::string                name;
    std::string                unit;
    std::optional<std::string> standard_name;   // e.g. "M44"
};

bool is_time_column(const std::string& column_header);
bool is_run_id_column(const std::string& column_header);

// "C0M44" -> "44";  nullopt for anything not shaped like a mass channel
std::optional<std::string> mass_of_block(const std::string& block_header);

/*
 * Display name, unit and standard name of one column.
 *
 *   ("C1M44",          "M44-CO2 [A]")    -> "M44 [A]", "A", "M44"
 *   ("MFC setpoint",   "Flow [ml/min]")  -> "MFC setpoint [ml/min]"
 *   ("pot",            "Time [s]")       -> "Potential time [s]", "s"
 *   ("EC-lab",         "Ewe/V")          -> "Ewe/V", "V"
 */
ColumnName form_column_name(const std::string& block_header,
                            const std::string& column_header);

} // namespace ecmsio
