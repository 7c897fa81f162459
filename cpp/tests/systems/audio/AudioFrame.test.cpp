// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/audio/AudioFrame.h"

#include "robotick/api.h"
#include "robotick/framework/registry/TypeRegistry.h"

#include <catch2/catch_all.hpp>

namespace tutorface::test
{
	TEST_CASE("Unit/Systems/Audio/AudioFrame")
	{
		SECTION("Frame types are known to the type registry")
		{
			CHECK(robotick::TypeRegistry::get().find_by_id(robotick::TypeId(GET_TYPE_ID(AudioFrame))) != nullptr);
			CHECK(robotick::TypeRegistry::get().find_by_id(robotick::TypeId(GET_TYPE_ID(AudioBuffer4096))) != nullptr);
		}

		SECTION("Default frame is empty with a 48kHz rate")
		{
			const AudioFrame frame;
			CHECK(frame.samples.empty());
			CHECK(frame.samples.capacity() == 4096);
			CHECK(frame.sample_rate == 48000);
			CHECK(frame.timestamp == 0.0);
		}
	}

} // namespace tutorface::test
