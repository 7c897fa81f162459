// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace tutorface
{
	// Writers that share the buffer. Each key belongs to exactly one of them.
	enum class MorphChannel : uint8_t
	{
		Viseme,
		Expression,
	};

	const char* to_string(MorphChannel channel);

	/**
	 * @brief Named morph-weight buffer read by the mesh layer.
	 *
	 * The first channel to write a key becomes its owner; later writes from the other
	 * channel are rejected, so the audio loop and the animation loop never fight over
	 * the same deformation target. Weights are kept in [0, 1].
	 */
	class MorphWeightBuffer
	{
	  public:
		struct Entry
		{
			float weight = 0.0f;
			MorphChannel owner = MorphChannel::Viseme;
		};

		using EntryMap = std::map<std::string, Entry>;

		// Adds delta to the key (clamped to [0, 1]). Returns false if another channel owns it.
		bool add_weight(MorphChannel channel, const std::string& key, float delta);

		// Overwrites the key (clamped to [0, 1]). Returns false if another channel owns it.
		bool set_weight(MorphChannel channel, const std::string& key, float value);

		// Multiplies every key owned by the channel by factor.
		void decay(MorphChannel channel, float factor);

		// Zeroes every key owned by the channel. Ownership is kept.
		void zero_channel(MorphChannel channel);

		float get_weight(const std::string& key) const;
		bool has_key(const std::string& key) const;
		bool get_owner(const std::string& key, MorphChannel& out_owner) const;

		const EntryMap& entries() const { return weights; }
		size_t size() const { return weights.size(); }

		uint32_t get_rejected_write_count() const { return rejected_writes; }

		// Drops every key and ownership record.
		void clear();

	  private:
		Entry* claim(MorphChannel channel, const std::string& key);

		EntryMap weights;
		uint32_t rejected_writes = 0;
	};

} // namespace tutorface
