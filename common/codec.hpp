#pragma once
#include <string>

#include "snapshot.hpp"
#include "wsync.pb.h"

// Shared state codec: converts between the in-memory model and the protobuf
// wire shapes. Decoders validate identifiers and reject malformed payloads;
// they never throw.

// encode_snapshot returns false only if protobuf serialization fails.
bool encode_snapshot(const WorkoutSnapshot& snapshot, std::string& bytes);
bool decode_snapshot(const std::string& bytes, WorkoutSnapshot& out, std::string* error = nullptr);

bool encode_set_completion(const Uuid& set_id, TimePoint completed_at, std::string& bytes);
bool decode_set_completion(const std::string& bytes, Uuid& set_id, TimePoint& completed_at);

bool encode_timer(const TimerSnapshot& timer, std::string& bytes);
bool decode_timer(const std::string& bytes, TimerSnapshot& out);

// Model <-> message conversions, shared with the text-format loader.
void to_message(const WorkoutSnapshot& snapshot, wsync::WorkoutData& msg);
bool from_message(const wsync::WorkoutData& msg, WorkoutSnapshot& out, std::string* error = nullptr);

/*
 * load_workout_textproto
 * Reads a wsync.WorkoutData in protobuf text format from |path|. Used by the
 * handheld to load the workout supplied by its domain collaborator.
 */
bool load_workout_textproto(const std::string& path, WorkoutSnapshot& out, std::string& error);
