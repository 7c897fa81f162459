// Copyright Robotick contributors
// SPDX-License-Identifier: Apache-2.0

#include "tutorface/systems/audio/AudioFrame.h"

#include "robotick/api.h"
#include "robotick/framework/registry/TypeDescriptor.h"
#include "robotick/framework/registry/TypeMacros.h"
#include "robotick/framework/registry/TypeRegistry.h"

// The type registry lives in the robotick namespace; the frame types are named into it
// so workload fields of these types can be reflected.
namespace robotick
{
	using tutorface::AudioBuffer4096;
	using tutorface::AudioFrame;

	ROBOTICK_REGISTER_FIXED_VECTOR(AudioBuffer4096, float);

	ROBOTICK_REGISTER_STRUCT_BEGIN(AudioFrame)
	ROBOTICK_STRUCT_FIELD(AudioFrame, AudioBuffer4096, samples)
	ROBOTICK_STRUCT_FIELD(AudioFrame, double, timestamp)
	ROBOTICK_STRUCT_FIELD(AudioFrame, uint32_t, sample_rate)
	ROBOTICK_REGISTER_STRUCT_END(AudioFrame)

} // namespace robotick
