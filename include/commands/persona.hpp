#pragma once

int cmd_persona(int argc, char** argv);
