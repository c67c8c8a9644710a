#pragma once
#include <string>
#include <vector>
#include "SessionAnalyzer.hpp"

/**
 * @brief Renders the per-channel, per-segment and per-episode text report.
 */
std::string format_session_report(const SessionReport& report);

/**
 * @brief Renders HRV rows as "Participant,Segment,RMSSD,SDNN,pNN50"; absent metrics are empty cells.
 * @param with_header Emit the column header line first.
 */
std::string format_hrv_csv(const std::string& participant, const HrvBatchReport& report, bool with_header = true);

/**
 * @brief One CSV for several participants: a single header, then every participant's rows.
 */
std::string format_hrv_batch_csv(const std::vector<ParticipantHrv>& batch);
