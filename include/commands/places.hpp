#pragma once

int cmd_places(int argc, char** argv);
