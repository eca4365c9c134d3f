#pragma once

void register_example();
