// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/MorphWeightBuffer.h"

#include "robotick/api.h"

namespace tutorface
{
	const char* to_string(MorphChannel channel)
	{
		switch (channel)
		{
		case MorphChannel::Viseme:
			return "viseme";
		case MorphChannel::Expression:
			return "expression";
		}
		return "unknown";
	}

	MorphWeightBuffer::Entry* MorphWeightBuffer::claim(MorphChannel channel, const std::string& key)
	{
		auto it = weights.find(key);
		if (it == weights.end())
		{
			Entry entry;
			entry.owner = channel;
			it = weights.emplace(key, entry).first;
			return &it->second;
		}

		if (it->second.owner != channel)
		{
			// only the first conflict is logged, the count keeps the rest visible
			if (rejected_writes == 0)
			{
				ROBOTICK_WARNING("MorphWeightBuffer - %s channel tried to write '%s' owned by the %s channel; write rejected",
					to_string(channel),
					key.c_str(),
					to_string(it->second.owner));
			}
			++rejected_writes;
			return nullptr;
		}

		return &it->second;
	}

	bool MorphWeightBuffer::add_weight(MorphChannel channel, const std::string& key, float delta)
	{
		Entry* entry = claim(channel, key);
		if (entry == nullptr)
		{
			return false;
		}

		entry->weight = robotick::clamp(entry->weight + delta, 0.0f, 1.0f);
		return true;
	}

	bool MorphWeightBuffer::set_weight(MorphChannel channel, const std::string& key, float value)
	{
		Entry* entry = claim(channel, key);
		if (entry == nullptr)
		{
			return false;
		}

		entry->weight = robotick::clamp(value, 0.0f, 1.0f);
		return true;
	}

	void MorphWeightBuffer::decay(MorphChannel channel, float factor)
	{
		const float safe_factor = robotick::clamp(factor, 0.0f, 1.0f);
		for (auto& [key, entry] : weights)
		{
			(void)key;
			if (entry.owner == channel)
			{
				entry.weight *= safe_factor;
			}
		}
	}

	void MorphWeightBuffer::zero_channel(MorphChannel channel)
	{
		for (auto& [key, entry] : weights)
		{
			(void)key;
			if (entry.owner == channel)
			{
				entry.weight = 0.0f;
			}
		}
	}

	float MorphWeightBuffer::get_weight(const std::string& key) const
	{
		const auto it = weights.find(key);
		return (it != weights.end()) ? it->second.weight : 0.0f;
	}

	bool MorphWeightBuffer::has_key(const std::string& key) const
	{
		return weights.find(key) != weights.end();
	}

	bool MorphWeightBuffer::get_owner(const std::string& key, MorphChannel& out_owner) const
	{
		const auto it = weights.find(key);
		if (it == weights.end())
		{
			return false;
		}

		out_owner = it->second.owner;
		return true;
	}

	void MorphWeightBuffer::clear()
	{
		weights.clear();
		rejected_writes = 0;
	}

} // namespace tutorface
